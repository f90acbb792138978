#include "corpus/corpus_loader.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace tg {

namespace {

// First present key among candidates, nullptr if none
const json* first_field(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

// Read an optional string-array field; false if present with the wrong shape
bool read_string_list(const json& j, std::initializer_list<const char*> keys,
                      std::vector<std::string>& out) {
    const json* field = first_field(j, keys);
    if (!field) return true;

    // A single string is accepted as a one-element list
    if (field->is_string()) {
        out.push_back(field->get<std::string>());
        return true;
    }
    if (!field->is_array()) return false;

    for (const auto& item : *field) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

std::vector<std::string> anchor_texts(const json& category_json, bool& malformed) {
    std::vector<std::string> texts;
    malformed = false;

    if (category_json.contains("negative_anchors")) {
        const auto& block = category_json["negative_anchors"];
        if (!block.is_array()) {
            malformed = true;
            return texts;
        }
        for (const auto& item : block) {
            texts.push_back(item.is_string() ? item.get<std::string>() : std::string());
        }
    }

    // Older corpora nest anchors as {"negative_vectors": {"texts": [...]}}
    if (category_json.contains("negative_vectors")) {
        const auto& block = category_json["negative_vectors"];
        if (!block.is_object() || (block.contains("texts") && !block["texts"].is_array())) {
            malformed = true;
            return texts;
        }
        if (block.contains("texts")) {
            for (const auto& item : block["texts"]) {
                texts.push_back(item.is_string() ? item.get<std::string>() : std::string());
            }
        }
    }

    return texts;
}

} // anonymous namespace

// ============================================================================
// LoadReport
// ============================================================================

json LoadReport::to_json() const {
    json j;
    j["categories"] = categories;
    j["patterns_loaded"] = patterns_loaded;
    j["anchors_loaded"] = anchors_loaded;
    json issues_array = json::array();
    for (const auto& issue : issues) {
        issues_array.push_back({
            {"category", issue.category},
            {"entry_index", issue.entry_index},
            {"reason", issue.reason}
        });
    }
    j["issues"] = issues_array;
    return j;
}

// ============================================================================
// CorpusLoader
// ============================================================================

Corpus CorpusLoader::load_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CorpusError("cannot open corpus file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (verbose_) {
        std::cout << "[corpus] Loading " << path << "\n";
    }

    return load_string(buffer.str());
}

Corpus CorpusLoader::load_string(const std::string& text) const {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CorpusError(std::string("not well-formed JSON: ") + e.what());
    }
    return load_json(j);
}

Corpus CorpusLoader::load_json(const json& j) const {
    if (!j.is_object()) {
        throw CorpusError("top level must be an object");
    }
    if (!j.contains("pattern_categories")) {
        throw CorpusError("missing 'pattern_categories'");
    }
    if (!j["pattern_categories"].is_object()) {
        throw CorpusError("'pattern_categories' must be an object");
    }
    if (j.contains("advanced_patterns") && !j["advanced_patterns"].is_object()) {
        throw CorpusError("'advanced_patterns' must be an object");
    }
    if (j.contains("negative_anchors") && !j["negative_anchors"].is_array()) {
        throw CorpusError("top-level 'negative_anchors' must be an array");
    }

    Corpus corpus;
    if (j.contains("version") && j["version"].is_string()) {
        corpus.version = j["version"].get<std::string>();
    }

    for (const auto& [name, category_json] : j["pattern_categories"].items()) {
        load_category(name, category_json, corpus);
    }

    // advanced_patterns carries extra categories; non-category keys
    // such as "description" are ignored
    if (j.contains("advanced_patterns")) {
        for (const auto& [name, category_json] : j["advanced_patterns"].items()) {
            if (category_json.is_object() && category_json.contains("patterns")) {
                load_category(name, category_json, corpus);
            }
        }
    }

    if (j.contains("negative_anchors")) {
        const auto& anchors = j["negative_anchors"];
        for (size_t i = 0; i < anchors.size(); ++i) {
            const auto& entry = anchors[i];
            int index = static_cast<int>(i);

            if (!entry.is_object() || !entry.contains("category") ||
                !entry["category"].is_string()) {
                record_issue(corpus, "", index, "negative anchor without a category");
                continue;
            }

            std::string category = entry["category"].get<std::string>();
            auto category_id = corpus.categories.find(category);
            if (!category_id) {
                record_issue(corpus, category, index,
                             "negative anchor references unknown category");
                continue;
            }

            const json* text = first_field(entry, {"text", "source_text"});
            if (!text || !text->is_string() || text->get<std::string>().empty()) {
                record_issue(corpus, category, index, "negative anchor without text");
                continue;
            }

            NegativeAnchor anchor;
            anchor.category = category;
            anchor.category_id = *category_id;
            anchor.source_text = text->get<std::string>();
            corpus.anchors.push_back(std::move(anchor));
        }
    }

    corpus.report.categories = corpus.categories.size();
    corpus.report.patterns_loaded = corpus.patterns.size();
    corpus.report.anchors_loaded = corpus.anchors.size();

    if (verbose_) {
        std::cout << "[corpus] Loaded " << corpus.patterns.size() << " patterns, "
                  << corpus.anchors.size() << " negative anchors across "
                  << corpus.categories.size() << " categories";
        if (!corpus.report.issues.empty()) {
            std::cout << " (" << corpus.report.issues.size() << " entries skipped)";
        }
        std::cout << "\n";
    }

    return corpus;
}

void CorpusLoader::load_category(
    const std::string& name,
    const json& category_json,
    Corpus& corpus
) const {
    if (!category_json.is_object()) {
        throw CorpusError("category '" + name + "' must be an object");
    }
    if (category_json.contains("patterns") && !category_json["patterns"].is_array()) {
        throw CorpusError("'patterns' of category '" + name + "' must be an array");
    }

    CategoryId category_id = corpus.categories.intern(name);

    if (category_json.contains("patterns")) {
        const auto& patterns = category_json["patterns"];

        for (size_t i = 0; i < patterns.size(); ++i) {
            const auto& entry = patterns[i];
            int index = static_cast<int>(i);

            if (!entry.is_object()) {
                record_issue(corpus, name, index, "pattern entry is not an object");
                continue;
            }

            const json* term = first_field(entry, {"term", "hanzi"});
            if (!term || !term->is_string() || term->get<std::string>().empty()) {
                record_issue(corpus, name, index, "missing term");
                continue;
            }

            const json* rendering = first_field(
                entry, {"primary_rendering", "primary_reading", "vn_term", "vn_correct"});
            if (!rendering || !rendering->is_string() ||
                rendering->get<std::string>().empty()) {
                record_issue(corpus, name, index,
                             "missing rendering for '" + term->get<std::string>() + "'");
                continue;
            }

            Pattern pattern;
            pattern.term = term->get<std::string>();
            pattern.category = name;
            pattern.category_id = category_id;
            pattern.primary_rendering = rendering->get<std::string>();

            std::vector<std::string> discouraged;
            std::vector<std::string> tags;
            if (!read_string_list(entry, {"alternate_renderings"}, pattern.alternate_renderings) ||
                !read_string_list(entry, {"discouraged_renderings", "avoid"}, discouraged) ||
                !read_string_list(entry, {"context_tags"}, tags)) {
                record_issue(corpus, name, index,
                             "malformed rendering or tag list for '" + pattern.term + "'");
                continue;
            }
            pattern.discouraged_renderings.insert(discouraged.begin(), discouraged.end());
            pattern.context_tags.insert(tags.begin(), tags.end());

            if (entry.contains("corpus_frequency")) {
                const auto& freq = entry["corpus_frequency"];
                if (!freq.is_number_integer() || freq.get<long long>() < 0) {
                    record_issue(corpus, name, index,
                                 "corpus_frequency must be a non-negative integer");
                    continue;
                }
                pattern.corpus_frequency = freq.get<std::uint64_t>();
            }

            const json* id = first_field(entry, {"id"});
            if (id && id->is_string() && !id->get<std::string>().empty()) {
                pattern.id = id->get<std::string>();
            } else {
                pattern.id = make_pattern_id(name, pattern.term);
            }

            corpus.patterns.push_back(std::move(pattern));
        }
    }

    bool malformed = false;
    auto texts = anchor_texts(category_json, malformed);
    if (malformed) {
        throw CorpusError("negative anchors of category '" + name + "' are malformed");
    }

    for (size_t i = 0; i < texts.size(); ++i) {
        if (texts[i].empty()) {
            record_issue(corpus, name, static_cast<int>(i), "empty negative anchor text");
            continue;
        }
        NegativeAnchor anchor;
        anchor.category = name;
        anchor.category_id = category_id;
        anchor.source_text = texts[i];
        corpus.anchors.push_back(std::move(anchor));
    }
}

void CorpusLoader::record_issue(
    Corpus& corpus,
    const std::string& category,
    int index,
    const std::string& reason
) const {
    corpus.report.issues.push_back({category, index, reason});
    if (verbose_) {
        std::cerr << "[corpus] Skipping entry";
        if (!category.empty()) std::cerr << " in " << category;
        if (index >= 0) std::cerr << " #" << index;
        std::cerr << ": " << reason << "\n";
    }
}

} // namespace tg
