#pragma once

#include <string>
#include <vector>

namespace tg {

/**
 * @brief Normalize a term for exact lookup
 *
 * Trims, collapses whitespace runs (ASCII and U+3000 ideographic space) to a
 * single ASCII space and lower-cases ASCII letters. No other folding.
 */
std::string normalize_term(const std::string& term);

/**
 * @brief Split a UTF-8 string into code points (each returned as a string)
 *
 * Malformed bytes are returned as single-byte units.
 */
std::vector<std::string> utf8_units(const std::string& text);

/**
 * @brief Number of UTF-8 code points in text
 */
size_t utf8_length(const std::string& text);

/**
 * @brief Cosine similarity of two vectors, 0.0 if sizes differ or either is zero
 */
double cosine_similarity(const std::vector<float>& vec1, const std::vector<float>& vec2);

/**
 * @brief Current UTC time formatted as ISO-8601 (e.g. 2026-01-31T12:00:00Z)
 */
std::string utc_timestamp();

/**
 * @brief Join strings with a separator
 */
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace tg
