#include "config/engine_config.hpp"
#include "embedding/embedder.hpp"
#include "engine/guidance_store.hpp"
#include <iostream>
#include <iomanip>

using namespace tg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Progress callback function
void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
        int percent = (current * 100) / total;
        std::cout << "(" << percent << "%) ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    print_separator("Terminology Guidance Example");

    std::cout << "This example demonstrates the complete flow:\n";
    std::cout << "  Corpus → Embeddings → Guidance Index → Bulk Lookup → Prompt Block\n\n";

    // =========================================================================
    // Configuration
    // =========================================================================

    print_separator("Step 1: Configuration");

    EngineConfig config;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        std::cout << "Loading configuration from: " << argv[2] << "\n";
        config = EngineConfig::from_json_file(argv[2]);
    } else {
        std::cout << "Loading configuration from .termguide.json or environment...\n";
        config = load_config_with_fallback("");
    }
    if (config.corpus_path.empty()) {
        config.corpus_path = "data/sample_corpus.json";
    }

    std::string error;
    if (!config.validate(error) || config.embedding_api_key.empty()) {
        std::cerr << "Configuration error: " << (error.empty() ? "no API key" : error) << "\n\n";
        std::cout << "Set an API key in one of:\n";
        std::cout << "  .termguide.json  (\"embedding_api_key\": \"...\")\n";
        std::cout << "  export GEMINI_API_KEY='your-key'\n";
        std::cout << "  export OPENAI_API_KEY='your-key' TG_EMBED_PROVIDER='openai'\n\n";

        config.embedding_api_key = "your-api-key-here";
        config.to_json_file("example_termguide_config.json");
        std::cout << "✓ Saved example config to: example_termguide_config.json\n";
        std::cout << "  Edit this file and run: " << argv[0] << " --config example_termguide_config.json\n\n";
        return 1;
    }

    std::cout << "✓ Configuration validated\n";
    std::cout << "  Provider: " << config.embedding_provider << "\n";
    std::cout << "  Model: " << config.to_embedder_config().model << "\n";
    std::cout << "  Corpus: " << config.corpus_path << "\n\n";

    // =========================================================================
    // Build Index
    // =========================================================================

    print_separator("Step 2: Build Guidance Index");

    std::unique_ptr<GuidanceStore> store;
    try {
        auto embedder = EmbedderFactory::create(config.embedding_provider, config.to_embedder_config());
        store = std::make_unique<GuidanceStore>(config, std::move(embedder));
        store->set_progress_callback(progress_handler);

        const LoadReport& report = store->load_corpus(config.corpus_path);
        std::cout << "Loaded " << report.patterns_loaded << " patterns, "
                  << report.anchors_loaded << " negative anchors\n\n";

        store->build_index(true);
    } catch (const std::exception& e) {
        std::cerr << "Build error: " << e.what() << "\n";
        return 1;
    }

    store->get_stats().index.print_summary();

    // =========================================================================
    // Single Queries
    // =========================================================================

    print_separator("Step 3: Single Queries");

    std::vector<std::pair<std::string, std::string>> queries = {
        {"金丹期", ""},
        {"金丹境", "他终于突破到了金丹境"},
        {"筑基元婴", ""},
        {"He entered the room", ""}
    };

    for (const auto& [term, context] : queries) {
        GuidanceResult result = store->query_one(term, context, "xianxia");
        std::cout << std::left << std::setw(24) << term
                  << std::setw(12) << to_string(result.lookup_path)
                  << std::setw(8) << to_string(result.confidence_tier)
                  << std::fixed << std::setprecision(3) << result.final_score;
        if (result.matched_pattern) {
            std::cout << "  → " << result.matched_pattern->primary_rendering;
        }
        std::cout << "\n";
    }

    // =========================================================================
    // Bulk Guidance
    // =========================================================================

    print_separator("Step 4: Bulk Guidance");

    std::vector<std::string> chapter_terms = {
        "师尊", "师兄", "灵气", "金丹期", "剑气纵横", "哼", "前辈", "师兄", "化神期"
    };

    BulkGuidanceReport report = store->query_bulk(chapter_terms, "xianxia", 5, 0.80);
    std::cout << store->format_for_prompt(report.results, true) << "\n";
    report.print_summary();

    print_separator("End of Guidance Example");
    return 0;
}
