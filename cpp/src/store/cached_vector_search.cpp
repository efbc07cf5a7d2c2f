#include "counselscript/store/cached_vector_search.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <boost/container_hash/hash.hpp>

#include <algorithm>

namespace counselscript {

CachedVectorSearch::CachedVectorSearch(std::shared_ptr<VectorStore> backend,
                                       std::chrono::seconds ttl,
                                       size_t capacity,
                                       ClockFunction clock)
    : backend_(std::move(backend)), ttl_(ttl), capacity_(std::max<size_t>(1, capacity)), clock_(std::move(clock)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(backend_, "CachedVectorSearch requires a backend store");
}

size_t CachedVectorSearch::cache_key(const Vector& query, size_t top_k, double threshold, const VectorFilter& filter) {
    size_t seed = boost::hash_range(query.begin(), query.end());
    boost::hash_combine(seed, top_k);
    boost::hash_combine(seed, threshold);
    boost::hash_combine(seed, hash_value(filter));
    return seed;
}

std::string CachedVectorSearch::insert(SuccessVectorRecord record) {
    return backend_->insert(std::move(record));
}

std::optional<SuccessVectorRecord> CachedVectorSearch::get_vector(const std::string& id) const {
    return backend_->get_vector(id);
}

std::vector<SuccessVectorRecord> CachedVectorSearch::get_success_vectors(const VectorFilter& filter) const {
    return backend_->get_success_vectors(filter);
}

bool CachedVectorSearch::enrich_metadata(const std::string& id, const Attributes& extra) {
    return backend_->enrich_metadata(id, extra);
}

void CachedVectorSearch::evict_expired_locked(Clock::time_point now) const {
    while (!insertion_order_.empty()) {
        auto it = entries_.find(insertion_order_.front());
        if (it != entries_.end() && it->second.expires_at > now) break;
        if (it != entries_.end()) {
            entries_.erase(it);
            ++stats_.evictions;
        }
        insertion_order_.pop_front();
    }
}

std::vector<ScoredRecord> CachedVectorSearch::nearest_neighbors(const Vector& query,
                                                                size_t top_k,
                                                                double similarity_threshold,
                                                                const VectorFilter& filter) const {
    const size_t key = cache_key(query, top_k, similarity_threshold, filter);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        evict_expired_locked(now);

        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.expires_at > now) {
            ++stats_.hits;
            LOG_DEBUG("Vector search cache hit");
            return it->second.results;
        }
        ++stats_.misses;
    }

    LOG_DEBUG("Vector search cache miss");
    auto results = backend_->nearest_neighbors(query, top_k, similarity_threshold, filter);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    bool inserted = entries_.insert_or_assign(key, Entry{results, now + ttl_}).second;
    if (inserted) {
        insertion_order_.push_back(key);
    }
    while (entries_.size() > capacity_ && !insertion_order_.empty()) {
        if (entries_.erase(insertion_order_.front())) ++stats_.evictions;
        insertion_order_.pop_front();
    }
    return results;
}

std::vector<std::vector<ScoredRecord>> CachedVectorSearch::batch_nearest_neighbors(
    const std::vector<Vector>& queries,
    size_t top_k,
    double similarity_threshold,
    const VectorFilter& filter) const {
    std::vector<std::vector<ScoredRecord>> results;
    results.reserve(queries.size());
    for (const auto& query : queries) {
        results.push_back(nearest_neighbors(query, top_k, similarity_threshold, filter));
    }
    return results;
}

void CachedVectorSearch::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
    LOG_INFO("Vector search cache cleared");
}

CacheStats CachedVectorSearch::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s = stats_;
    s.entries = entries_.size();
    return s;
}

} // namespace counselscript
