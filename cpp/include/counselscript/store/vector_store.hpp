#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "counselscript/types.hpp"
#include "counselscript/vector_ops.hpp"

namespace counselscript {

// A default-constructed filter selects successful records only
struct VectorFilter {
    std::optional<bool> is_success = true;
    std::optional<TimePoint> created_from;
    std::optional<TimePoint> created_to;
    std::vector<std::string> counselor_names;      // empty = any counselor
    std::optional<double> min_success_rate;        // metadata "success_rate"

    bool matches(const SuccessVectorRecord& record) const;

    static VectorFilter any() {
        VectorFilter f;
        f.is_success.reset();
        return f;
    }
};

size_t hash_value(const VectorFilter& filter);

/**
 * Storage and nearest-neighbour contract for success vectors.
 *
 * nearest_neighbors similarity is cosine (1 - cosine distance), filtered to
 * similarity >= threshold, ordered by descending similarity with ties in
 * storage order.
 */
class VectorStore {
public:
    virtual ~VectorStore() = default;

    // Returns the record id; one is generated when record.id is empty
    virtual std::string insert(SuccessVectorRecord record) = 0;

    virtual std::optional<SuccessVectorRecord> get_vector(const std::string& id) const = 0;

    // Storage order
    virtual std::vector<SuccessVectorRecord> get_success_vectors(const VectorFilter& filter) const = 0;

    virtual std::vector<ScoredRecord> nearest_neighbors(const Vector& query,
                                                        size_t top_k,
                                                        double similarity_threshold,
                                                        const VectorFilter& filter) const = 0;

    // Merges extra attributes into the record metadata; false if the id is unknown
    virtual bool enrich_metadata(const std::string& id, const Attributes& extra) = 0;
};

// Brute-force store for tests and small deployments
class InMemoryVectorStore : public VectorStore {
public:
    explicit InMemoryVectorStore(size_t dimension = 1536,
                                 vecops::DimensionPolicy policy = vecops::DimensionPolicy::Reject);

    std::string insert(SuccessVectorRecord record) override;
    std::optional<SuccessVectorRecord> get_vector(const std::string& id) const override;
    std::vector<SuccessVectorRecord> get_success_vectors(const VectorFilter& filter) const override;
    std::vector<ScoredRecord> nearest_neighbors(const Vector& query,
                                                size_t top_k,
                                                double similarity_threshold,
                                                const VectorFilter& filter) const override;
    bool enrich_metadata(const std::string& id, const Attributes& extra) override;

    size_t size() const;
    size_t dimension() const { return dimension_; }

private:
    size_t dimension_;
    vecops::DimensionPolicy policy_;
    std::vector<SuccessVectorRecord> records_;
    std::unordered_map<std::string, size_t> index_;
    mutable std::shared_mutex mutex_;
};

} // namespace counselscript
