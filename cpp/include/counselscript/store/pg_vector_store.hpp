#pragma once

#include <memory>

#include "counselscript/db/connection.hpp"
#include "counselscript/store/vector_store.hpp"

namespace counselscript {

/**
 * pgvector-backed VectorStore.
 *
 * Similarity is 1 - (embedding <=> query); ties are broken by insertion
 * sequence so results match InMemoryVectorStore ordering.
 */
class PgVectorStore : public VectorStore {
public:
    PgVectorStore(std::shared_ptr<db::ConnectionPool> pool, size_t dimension = 1536,
                  vecops::DimensionPolicy policy = vecops::DimensionPolicy::Reject);

    std::string insert(SuccessVectorRecord record) override;
    std::optional<SuccessVectorRecord> get_vector(const std::string& id) const override;
    std::vector<SuccessVectorRecord> get_success_vectors(const VectorFilter& filter) const override;
    std::vector<ScoredRecord> nearest_neighbors(const Vector& query,
                                                size_t top_k,
                                                double similarity_threshold,
                                                const VectorFilter& filter) const override;
    bool enrich_metadata(const std::string& id, const Attributes& extra) override;

    size_t dimension() const { return dimension_; }

private:
    std::shared_ptr<db::ConnectionPool> pool_;
    size_t dimension_;
    vecops::DimensionPolicy policy_;
};

} // namespace counselscript
