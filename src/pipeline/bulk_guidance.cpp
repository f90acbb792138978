#include "pipeline/bulk_guidance.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <set>
#include <system_error>
#include <thread>

using json = nlohmann::json;

namespace tg {

// ==========================================
// BulkGuidanceReport
// ==========================================

void BulkGuidanceReport::print_summary() const {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Bulk Guidance Summary\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << "Terms: " << total_terms << "\n";
    std::cout << "  Direct hits: " << direct_hits << "\n";
    std::cout << "  Vector hits: " << vector_hits << "\n";
    std::cout << "  Aggregated: " << aggregated_hits << "\n";
    std::cout << "  Not found: " << not_found << " (rate limited: " << rate_limited << ")\n\n";

    std::cout << "Negative penalties applied: " << neg_penalties_applied << "\n";
    std::cout << "Cache hits: " << cache_hits << "\n";
    std::cout << "API calls: " << api_calls_made << "\n";
    std::cout << "High confidence: " << high_confidence.size()
              << ", medium: " << medium_confidence.size() << "\n";
    std::cout << "Time: " << elapsed_seconds << " seconds\n";
    std::cout << std::string(60, '=') << "\n";
}

json BulkGuidanceReport::to_json() const {
    json j;
    j["lookup_stats"] = {
        {"total_terms", total_terms},
        {"direct_hits", direct_hits},
        {"vector_hits", vector_hits},
        {"aggregated_hits", aggregated_hits},
        {"neg_penalties_applied", neg_penalties_applied},
        {"not_found", not_found},
        {"rate_limited", rate_limited},
        {"cache_hits", cache_hits},
        {"api_calls_made", api_calls_made}
    };
    j["elapsed_seconds"] = elapsed_seconds;

    auto to_array = [](const std::vector<GuidanceResult>& items) {
        json arr = json::array();
        for (const auto& item : items) {
            arr.push_back(item.to_json());
        }
        return arr;
    };
    j["high_confidence"] = to_array(high_confidence);
    j["medium_confidence"] = to_array(medium_confidence);
    j["results"] = to_array(results);
    return j;
}

// ==========================================
// SessionCache
// ==========================================

SessionCache::SessionCache(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries) {}

std::optional<GuidanceResult> SessionCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionCache::put(const std::string& key, const GuidanceResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = result;
        return;
    }

    while (entries_.size() >= max_entries_ && !order_.empty()) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
    entries_.emplace(key, result);
    order_.push_back(key);
}

size_t SessionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SessionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
}

// ==========================================
// BulkGuidanceOrchestrator
// ==========================================

BulkGuidanceOrchestrator::BulkGuidanceOrchestrator(
    std::shared_ptr<const DisambiguationEngine> engine,
    size_t concurrency,
    size_t cache_size
)
    : engine_(std::move(engine)),
      concurrency_(concurrency == 0 ? 1 : concurrency),
      cache_(cache_size) {
    if (!engine_) {
        throw std::invalid_argument("BulkGuidanceOrchestrator requires an engine");
    }
}

std::string BulkGuidanceOrchestrator::cache_key(
    const std::string& term,
    const std::string& genre,
    const std::string& context
) {
    return normalize_term(term) + '\x1f' + normalize_term(genre) + '\x1f' + normalize_term(context);
}

BulkGuidanceReport BulkGuidanceOrchestrator::bulk_guidance(
    const std::vector<std::string>& terms,
    const std::string& genre,
    size_t max_api_calls,
    double min_confidence,
    const std::string& context
) {
    auto start_time = std::chrono::high_resolution_clock::now();

    BulkGuidanceReport report;
    report.total_terms = terms.size();

    // Unique keys in first-seen order; cached ones need no lookup
    std::vector<std::string> keys(terms.size());
    std::unordered_map<std::string, size_t> first_seen;
    std::unordered_map<std::string, GuidanceResult> batch_results;
    std::set<std::string> fresh_keys;
    std::vector<std::string> pending_terms;
    std::vector<std::string> pending_keys;

    for (size_t i = 0; i < terms.size(); ++i) {
        keys[i] = cache_key(terms[i], genre, context);
        if (first_seen.count(keys[i])) continue;
        first_seen[keys[i]] = i;

        if (auto cached = cache_.get(keys[i])) {
            batch_results.emplace(keys[i], std::move(*cached));
        } else {
            pending_terms.push_back(terms[i]);
            pending_keys.push_back(keys[i]);
            fresh_keys.insert(keys[i]);
        }
    }

    QueryOptions options;
    options.genre = genre;
    options.context = context;

    ApiBudget budget(max_api_calls);
    std::vector<GuidanceResult> fresh = run_workers(pending_terms, options, budget);

    for (size_t i = 0; i < fresh.size(); ++i) {
        // Rate-limited or failed lookups stay uncached so a later batch can retry
        if (!fresh[i].rate_limited && !fresh[i].embedding_failed) {
            cache_.put(pending_keys[i], fresh[i]);
        }
        batch_results.emplace(pending_keys[i], std::move(fresh[i]));
    }

    std::set<std::string> in_views;
    for (size_t i = 0; i < terms.size(); ++i) {
        GuidanceResult result = batch_results.at(keys[i]);
        bool looked_up = fresh_keys.count(keys[i]) && first_seen[keys[i]] == i;
        if (!looked_up) {
            report.cache_hits++;
        }
        result.query_term = terms[i];

        switch (result.lookup_path) {
            case LookupPath::Direct:
                report.direct_hits++;
                break;
            case LookupPath::Vector:
                if (result.found()) report.vector_hits++;
                break;
            case LookupPath::Aggregated:
                report.aggregated_hits++;
                break;
            case LookupPath::None:
                break;
        }
        if (!result.found()) report.not_found++;
        if (result.rate_limited) report.rate_limited++;
        if (result.negative_penalty > 0.0) report.neg_penalties_applied++;

        if (result.found() && in_views.insert(keys[i]).second) {
            if (result.final_score >= min_confidence) {
                report.high_confidence.push_back(result);
            } else if (result.confidence_tier != ConfidenceTier::Ignore) {
                report.medium_confidence.push_back(result);
            }
        }

        report.results.push_back(std::move(result));
    }

    auto by_score = [](const GuidanceResult& a, const GuidanceResult& b) {
        if (a.final_score != b.final_score) return a.final_score > b.final_score;
        return a.query_term < b.query_term;
    };
    std::sort(report.high_confidence.begin(), report.high_confidence.end(), by_score);
    std::sort(report.medium_confidence.begin(), report.medium_confidence.end(), by_score);

    report.api_calls_made = budget.used();

    auto end_time = std::chrono::high_resolution_clock::now();
    report.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();

    if (engine_->config().verbose) {
        std::cout << "[bulk] " << report.total_terms << " terms, "
                  << report.direct_hits << " direct, " << report.vector_hits << " vector, "
                  << report.not_found << " not found, " << report.api_calls_made << " API calls\n";
    }

    return report;
}

std::vector<GuidanceResult> BulkGuidanceOrchestrator::run_workers(
    const std::vector<std::string>& terms,
    const QueryOptions& options,
    ApiBudget& budget
) const {
    std::vector<GuidanceResult> results(terms.size());
    if (terms.empty()) {
        return results;
    }

    std::atomic<size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= terms.size()) break;
            try {
                results[i] = engine_->query_one(terms[i], options, &budget);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) failure = std::current_exception();
                next.store(terms.size());
                break;
            }
        }
    };

    size_t thread_count = std::min(concurrency_, terms.size());
    if (thread_count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        try {
            for (size_t t = 0; t < thread_count; ++t) {
                threads.emplace_back(worker);
            }
        } catch (const std::system_error&) {
            next.store(terms.size());
            for (auto& thread : threads) {
                thread.join();
            }
            throw;
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

} // namespace tg
