#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "counselscript/store/vector_store.hpp"

namespace counselscript {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t entries = 0;
    size_t evictions = 0;

    double hit_rate() const {
        size_t total = hits + misses;
        return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/**
 * Read-through cache in front of nearest_neighbors.
 *
 * Entries are keyed by a hash of the query vector, top_k, threshold and
 * filter, expire after the TTL and are evicted oldest-first past capacity.
 * Cached results are advisory; all other calls pass straight through.
 */
class CachedVectorSearch : public VectorStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFunction = std::function<Clock::time_point()>;

    CachedVectorSearch(std::shared_ptr<VectorStore> backend,
                       std::chrono::seconds ttl = std::chrono::seconds(3600),
                       size_t capacity = 1024,
                       ClockFunction clock = &Clock::now);

    std::string insert(SuccessVectorRecord record) override;
    std::optional<SuccessVectorRecord> get_vector(const std::string& id) const override;
    std::vector<SuccessVectorRecord> get_success_vectors(const VectorFilter& filter) const override;
    std::vector<ScoredRecord> nearest_neighbors(const Vector& query,
                                                size_t top_k,
                                                double similarity_threshold,
                                                const VectorFilter& filter) const override;
    bool enrich_metadata(const std::string& id, const Attributes& extra) override;

    // One result list per query, in query order
    std::vector<std::vector<ScoredRecord>> batch_nearest_neighbors(const std::vector<Vector>& queries,
                                                                   size_t top_k,
                                                                   double similarity_threshold,
                                                                   const VectorFilter& filter) const;

    void clear();
    CacheStats stats() const;

    static size_t cache_key(const Vector& query, size_t top_k, double threshold, const VectorFilter& filter);

private:
    struct Entry {
        std::vector<ScoredRecord> results;
        Clock::time_point expires_at;
    };

    void evict_expired_locked(Clock::time_point now) const;

    std::shared_ptr<VectorStore> backend_;
    std::chrono::seconds ttl_;
    size_t capacity_;
    ClockFunction clock_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<size_t, Entry> entries_;
    mutable std::deque<size_t> insertion_order_;
    mutable CacheStats stats_;
};

} // namespace counselscript
