#pragma once

#include <string>
#include <vector>

#include "counselscript/clustering/clustering_engine.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"

namespace counselscript {

struct ClusterRunSummary {
    std::string cluster_result_id;
    std::vector<std::string> vector_ids;    // vector_ids[i] belongs to output.assignments[i]
    ClusteringOutput output;
};

/**
 * Fetch, cluster, persist.
 *
 * distance_to_centroid is recomputed on save from the embedding the store
 * holds at that moment, not from the array that was clustered. Noise
 * points are saved with +infinity; vectors that vanished from the store
 * get a null distance.
 */
class ClusteringService {
public:
    ClusteringService(const VectorStore& store, ClusterRepository& repository, const ClusteringEngine& engine);

    Outcome<ClusterRunSummary> perform_clustering(const ClusteringRequest& request,
                                                  const VectorFilter& filter = VectorFilter{});

private:
    const VectorStore& store_;
    ClusterRepository& repository_;
    const ClusteringEngine& engine_;
};

} // namespace counselscript
