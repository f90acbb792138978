#include "core/text_utils.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tg {

namespace {

// Byte length of the UTF-8 sequence introduced by lead byte c (1 if malformed)
size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

std::vector<std::string> utf8_units(const std::string& text) {
    std::vector<std::string> units;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) {
            len = 1;
        }
        for (size_t k = 1; k < len; ++k) {
            if (!is_continuation(static_cast<unsigned char>(text[i + k]))) {
                len = 1;
                break;
            }
        }
        units.push_back(text.substr(i, len));
        i += len;
    }
    return units;
}

size_t utf8_length(const std::string& text) {
    return utf8_units(text).size();
}

std::string normalize_term(const std::string& term) {
    static const std::string kIdeographicSpace = "\xE3\x80\x80";

    std::string result;
    result.reserve(term.size());
    bool pending_space = false;

    for (const auto& unit : utf8_units(term)) {
        bool is_space = unit == kIdeographicSpace ||
            (unit.size() == 1 && (unit[0] == ' ' || unit[0] == '\t' ||
                                  unit[0] == '\n' || unit[0] == '\r' ||
                                  unit[0] == '\f' || unit[0] == '\v'));
        if (is_space) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        if (unit.size() == 1 && unit[0] >= 'A' && unit[0] <= 'Z') {
            result += static_cast<char>(unit[0] - 'A' + 'a');
        } else {
            result += unit;
        }
    }

    return result;
}

double cosine_similarity(const std::vector<float>& vec1, const std::vector<float>& vec2) {
    if (vec1.size() != vec2.size() || vec1.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    double norm1 = 0.0;
    double norm2 = 0.0;

    for (size_t i = 0; i < vec1.size(); ++i) {
        dot += static_cast<double>(vec1[i]) * vec2[i];
        norm1 += static_cast<double>(vec1[i]) * vec1[i];
        norm2 += static_cast<double>(vec2[i]) * vec2[i];
    }

    if (norm1 == 0.0 || norm2 == 0.0) {
        return 0.0;
    }

    return dot / (std::sqrt(norm1) * std::sqrt(norm2));
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

} // namespace tg
