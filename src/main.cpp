#include "cli/cli.hpp"
#include "config/engine_config.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include "embedding/embedder.hpp"
#include "engine/guidance_store.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

using namespace tg;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Config file (or fallback chain) with command-line overrides applied
EngineConfig load_config(const Args& args) {
    EngineConfig config = load_config_with_fallback(args.get("config", "").value);

    if (args.has("corpus")) config.corpus_path = args.get("corpus").value;
    if (args.has("index")) config.index_path = args.get("index").value;
    if (args.has("verbose")) config.verbose = args.get("verbose").as_flag();

    return config;
}

std::unique_ptr<GuidanceStore> make_store(const EngineConfig& config) {
    if (config.embedding_api_key.empty()) {
        throw ConfigError("no API key for embedding provider '" + config.embedding_provider +
                          "' (set it in .termguide.json or the environment)");
    }

    std::shared_ptr<Embedder> embedder =
        EmbedderFactory::create(config.embedding_provider, config.to_embedder_config());
    return std::make_unique<GuidanceStore>(config, embedder);
}

// Load a saved index, or build one from the corpus if none exists yet
std::unique_ptr<GuidanceStore> open_store(const EngineConfig& config) {
    auto store = make_store(config);

    if (fs::exists(config.index_path)) {
        store->load_index(config.index_path);
    } else if (!config.corpus_path.empty()) {
        std::cout << "No index at " << config.index_path << ", building from " << config.corpus_path << "\n";
        store->load_corpus(config.corpus_path);
        store->build_index(true);
        store->save_index(config.index_path);
    } else {
        throw std::runtime_error("No index at " + config.index_path + " and no --corpus given");
    }
    return store;
}

std::vector<std::string> read_terms_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open terms file: " + path);
    }

    std::vector<std::string> terms;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) terms.push_back(line);
    }
    return terms;
}

void print_result(const GuidanceResult& result) {
    std::cout << result.query_term << "\n";
    std::cout << "  Path: " << to_string(result.lookup_path)
              << "  Tier: " << to_string(result.confidence_tier) << "\n";
    std::cout << std::fixed << std::setprecision(3)
              << "  Score: " << result.final_score
              << " (raw " << result.raw_similarity
              << ", penalty " << result.negative_penalty << ")\n";
    std::cout.unsetf(std::ios::floatfield);

    if (result.matched_pattern) {
        const Pattern& p = *result.matched_pattern;
        std::cout << "  Rendering: " << p.primary_rendering << " [" << p.category << "]\n";
        if (!p.alternate_renderings.empty()) {
            std::cout << "  Alternates: " << join(p.alternate_renderings, ", ") << "\n";
        }
        if (!p.discouraged_renderings.empty()) {
            std::vector<std::string> avoid(p.discouraged_renderings.begin(), p.discouraged_renderings.end());
            std::cout << "  Avoid: " << join(avoid, ", ") << "\n";
        }
    } else if (result.rate_limited) {
        std::cout << "  Not looked up (API call budget exhausted)\n";
    } else {
        std::cout << "  No match\n";
    }
}

// ============== termguide build ==============
int cmd_build(const Args& args) {
    EngineConfig config = load_config(args);
    if (args.has("batch-size")) config.upsert_batch_size = args.get("batch-size").as_size();
    bool force = args.get("force").as_flag();

    if (config.corpus_path.empty()) {
        std::cerr << "Error: --corpus is required (or corpus_path in config)\n";
        return kExitUsage;
    }

    auto store = make_store(config);

    if (!force && fs::exists(config.index_path)) {
        store->load_index(config.index_path);
        std::cout << "Index already exists at " << config.index_path << " (use --force to rebuild)\n";
        store->get_stats().index.print_summary();
        return kExitOk;
    }

    std::cout << "Loading corpus from: " << config.corpus_path << "\n";
    const LoadReport& report = store->load_corpus(config.corpus_path);
    std::cout << "Loaded " << report.patterns_loaded << " patterns in " << report.categories
              << " categories, " << report.anchors_loaded << " negative anchors";
    if (!report.issues.empty()) {
        std::cout << " (" << report.issues.size() << " entries skipped)";
    }
    std::cout << "\n";

    store->set_progress_callback([](const std::string& stage, int current, int total, const std::string&) {
        std::cout << "\r  " << stage << ": " << current << "/" << total << std::flush;
        if (current == total) std::cout << "\n";
    });

    auto start = std::chrono::steady_clock::now();
    IndexStats stats = store->build_index(true);
    auto elapsed = std::chrono::steady_clock::now() - start;

    fs::path index_path(config.index_path);
    if (index_path.has_parent_path()) {
        fs::create_directories(index_path.parent_path());
    }
    std::cout << "Saving index to: " << config.index_path << "\n";
    store->save_index(config.index_path);

    stats.print_summary();
    std::cout << "\nIndex built in " << format_duration(elapsed) << "\n";
    return kExitOk;
}

// ============== termguide query ==============
int cmd_query(const Args& args) {
    std::string term = args.require("term");
    std::string context = args.get("context", "").value;
    std::string genre = args.get("genre", "").value;

    EngineConfig config = load_config(args);
    auto store = open_store(config);

    GuidanceResult result = store->query_one(term, context, genre);

    if (args.get("json").as_flag()) {
        std::cout << result.to_json().dump(2) << "\n";
    } else {
        print_result(result);
    }
    return kExitOk;
}

// ============== termguide bulk ==============
int cmd_bulk(const Args& args) {
    std::vector<std::string> terms = args.get("terms", "").as_list();
    if (args.has("file")) {
        auto from_file = read_terms_file(args.get("file").value);
        terms.insert(terms.end(), from_file.begin(), from_file.end());
    }
    if (terms.empty()) {
        std::cerr << "Error: give terms with --terms or --file\n";
        return kExitUsage;
    }

    EngineConfig config = load_config(args);
    size_t max_api_calls = args.get("max-api-calls").as_size(config.max_api_calls);
    double min_confidence = args.get("min-confidence").as_double(config.min_confidence);
    std::string genre = args.get("genre", "").value;
    bool include_suggestions = args.get("suggestions").as_flag();

    auto store = open_store(config);
    BulkGuidanceReport report = store->query_bulk(terms, genre, max_api_calls, min_confidence);

    if (args.get("json").as_flag()) {
        std::cout << report.to_json().dump(2) << "\n";
    } else {
        std::string block = store->format_for_prompt(report.results, include_suggestions);
        if (block.empty()) {
            std::cout << "No guidance above the confidence gate.\n";
        } else {
            std::cout << block;
        }
        report.print_summary();
    }

    std::string log_path = args.get("uncertain-log", config.uncertain_log_path).value;
    if (!log_path.empty() && store->uncertain_log()->size() > 0) {
        store->uncertain_log()->save_to_json(log_path);
        std::cout << "Uncertain matches written to " << log_path << "\n";
    }
    return kExitOk;
}

// ============== termguide stats ==============
int cmd_stats(const Args& args) {
    EngineConfig config = load_config(args);
    auto store = make_store(config);

    if (!fs::exists(config.index_path)) {
        std::cerr << "Error: no index at " << config.index_path << "\n";
        return kExitUsage;
    }
    store->load_index(config.index_path);

    GuidanceStats stats = store->get_stats();
    if (args.get("json").as_flag()) {
        std::cout << stats.to_json().dump(2) << "\n";
        return kExitOk;
    }

    std::cout << "\nGuidance Index: " << config.index_path << "\n";
    std::cout << "  Vectors: " << stats.collection_count << "\n";
    std::cout << "  Embedding model: " << stats.embedding_model_id << "\n";
    std::cout << "  Categories (" << stats.categories.size() << "): " << join(stats.categories, ", ") << "\n";
    std::cout << "  Thresholds: inject >= " << stats.thresholds.inject
              << ", log >= " << stats.thresholds.log << "\n";
    std::cout << "  Negative anchors: penalty " << stats.negative_anchor.penalty
              << " at similarity >= " << stats.negative_anchor.threshold << "\n";
    stats.index.print_summary();
    return kExitOk;
}

int main(int argc, char** argv) {
    CLI cli("termguide", "1.0.0");

    // termguide build
    cli.register_command({
        "build",
        "Embed a pattern corpus and save the guidance index",
        {
            {"corpus", "i", "Pattern corpus JSON file", "", false, false},
            {"index", "x", "Output index file", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"batch-size", "b", "Patterns per embedding batch", "", false, false},
            {"force", "f", "Rebuild even if the index exists", "", false, true},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_build
    });

    // termguide query
    cli.register_command({
        "query",
        "Resolve a single term",
        {
            {"term", "t", "Source term", "", true, false},
            {"context", "C", "Surrounding text", "", false, false},
            {"genre", "g", "Genre tag used to bias ranking", "", false, false},
            {"index", "x", "Index file", "", false, false},
            {"corpus", "i", "Corpus to build from if the index is missing", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"json", "j", "Print the result as JSON", "", false, true},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_query
    });

    // termguide bulk
    cli.register_command({
        "bulk",
        "Resolve many terms and print a prompt guidance block",
        {
            {"terms", "t", "Comma-separated terms", "", false, false},
            {"file", "F", "File with one term per line", "", false, false},
            {"genre", "g", "Genre tag used to bias ranking", "", false, false},
            {"max-api-calls", "m", "Embedding lookups allowed for this batch", "", false, false},
            {"min-confidence", "k", "Cut for the high-confidence view", "", false, false},
            {"suggestions", "s", "Include LOG-tier suggestions in the block", "", false, true},
            {"uncertain-log", "u", "Write LOG-tier matches to this JSON file", "", false, false},
            {"index", "x", "Index file", "", false, false},
            {"corpus", "i", "Corpus to build from if the index is missing", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"json", "j", "Print the report as JSON", "", false, true},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_bulk
    });

    // termguide stats
    cli.register_command({
        "stats",
        "Print statistics about a saved index",
        {
            {"index", "x", "Index file", "", false, false},
            {"config", "c", "Path to config file (optional)", "", false, false},
            {"json", "j", "Print as JSON", "", false, true}
        },
        cmd_stats
    });

    return cli.run(argc, argv);
}
