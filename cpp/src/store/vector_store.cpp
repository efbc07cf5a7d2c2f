#include "counselscript/store/vector_store.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/ids.hpp"

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <mutex>

namespace counselscript {

bool VectorFilter::matches(const SuccessVectorRecord& record) const {
    if (is_success && record.is_success != *is_success) return false;
    if (created_from && record.created_at < *created_from) return false;
    if (created_to && record.created_at > *created_to) return false;
    if (!counselor_names.empty() &&
        std::find(counselor_names.begin(), counselor_names.end(), record.counselor_name) == counselor_names.end()) {
        return false;
    }
    if (min_success_rate) {
        auto rate = attribute_as_double(record.metadata, "success_rate");
        if (!rate || *rate < *min_success_rate) return false;
    }
    return true;
}

size_t hash_value(const VectorFilter& filter) {
    size_t seed = 0;
    boost::hash_combine(seed, filter.is_success.has_value());
    boost::hash_combine(seed, filter.is_success.value_or(false));
    boost::hash_combine(seed, filter.created_from ? filter.created_from->time_since_epoch().count() : 0);
    boost::hash_combine(seed, filter.created_to ? filter.created_to->time_since_epoch().count() : 0);
    boost::hash_range(seed, filter.counselor_names.begin(), filter.counselor_names.end());
    boost::hash_combine(seed, filter.min_success_rate.has_value());
    boost::hash_combine(seed, filter.min_success_rate.value_or(0.0));
    return seed;
}

InMemoryVectorStore::InMemoryVectorStore(size_t dimension, vecops::DimensionPolicy policy)
    : dimension_(dimension), policy_(policy) {
    if (dimension_ == 0) {
        throw InvalidArgumentError("Vector dimension must be positive");
    }
}

std::string InMemoryVectorStore::insert(SuccessVectorRecord record) {
    if (!vecops::conform_dimension(record.vector, dimension_, policy_)) {
        throw InvalidArgumentError("Vector has " + std::to_string(record.vector.size()) +
                                   " components, store expects " + std::to_string(dimension_));
    }
    if (record.id.empty()) record.id = util::generate_id();
    if (record.created_at == TimePoint{}) record.created_at = std::chrono::system_clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (index_.count(record.id)) {
        throw InvalidArgumentError("Duplicate vector id: " + record.id);
    }
    index_[record.id] = records_.size();
    records_.push_back(std::move(record));
    return records_.back().id;
}

std::optional<SuccessVectorRecord> InMemoryVectorStore::get_vector(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return records_[it->second];
}

std::vector<SuccessVectorRecord> InMemoryVectorStore::get_success_vectors(const VectorFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SuccessVectorRecord> out;
    for (const auto& record : records_) {
        if (filter.matches(record)) out.push_back(record);
    }
    return out;
}

std::vector<ScoredRecord> InMemoryVectorStore::nearest_neighbors(const Vector& query,
                                                                 size_t top_k,
                                                                 double similarity_threshold,
                                                                 const VectorFilter& filter) const {
    Vector q = query;
    if (!vecops::conform_dimension(q, dimension_, policy_)) {
        throw InvalidArgumentError("Query has " + std::to_string(query.size()) +
                                   " components, store expects " + std::to_string(dimension_));
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<const SuccessVectorRecord*> candidates;
    std::vector<const Vector*> vectors;
    for (const auto& record : records_) {
        if (filter.matches(record)) {
            candidates.push_back(&record);
            vectors.push_back(&record.vector);
        }
    }

    auto top = vecops::find_top_k_cosine(q, vectors, top_k, similarity_threshold);

    std::vector<ScoredRecord> results;
    results.reserve(top.size());
    for (const auto& hit : top) {
        results.push_back({*candidates[hit.index], hit.similarity});
    }

    LOG_DEBUG("Nearest neighbours: ", results.size(), " of ", candidates.size(), " candidates above ",
              similarity_threshold);
    return results;
}

bool InMemoryVectorStore::enrich_metadata(const std::string& id, const Attributes& extra) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    for (const auto& [key, value] : extra) {
        records_[it->second].metadata[key] = value;
    }
    return true;
}

size_t InMemoryVectorStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

} // namespace counselscript
