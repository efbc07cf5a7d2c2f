#include "counselscript/clustering/clustering_service.hpp"
#include "counselscript/logging.hpp"

#include <limits>

namespace counselscript {

ClusteringService::ClusteringService(const VectorStore& store, ClusterRepository& repository,
                                     const ClusteringEngine& engine)
    : store_(store), repository_(repository), engine_(engine) {}

Outcome<ClusterRunSummary> ClusteringService::perform_clustering(const ClusteringRequest& request,
                                                                 const VectorFilter& filter) {
    auto records = store_.get_success_vectors(filter);
    if (records.size() < 2) {
        return Outcome<ClusterRunSummary>::failure(ErrorCode::INVALID_ARGUMENT,
                                                   "Clustering needs at least 2 success vectors, found " +
                                                   std::to_string(records.size()));
    }
    LOG_INFO("Clustering ", records.size(), " success vectors");

    std::vector<Vector> vectors;
    std::vector<std::string> ids;
    vectors.reserve(records.size());
    ids.reserve(records.size());
    for (auto& record : records) {
        vectors.push_back(std::move(record.vector));
        ids.push_back(record.id);
    }

    auto clustered = engine_.cluster(vectors, request);
    if (!clustered) return clustered.error();

    ClusterRunSummary summary;
    summary.output = std::move(clustered).value();
    summary.vector_ids = ids;
    const auto& output = summary.output;

    std::vector<ClusterAssignment> assignments;
    assignments.reserve(output.assignments.size());
    for (const auto& point : output.assignments) {
        ClusterAssignment a;
        a.vector_id = ids[point.vector_index];
        a.cluster_label = point.cluster_label;

        const int label = point.cluster_label;
        if (label < 0) {
            a.distance_to_centroid = std::numeric_limits<double>::infinity();
        } else if (static_cast<size_t>(label) < output.centroids.size()) {
            auto stored = store_.get_vector(a.vector_id);
            if (stored && vecops::conform_dimension(stored->vector, engine_.dimension(), engine_.policy())) {
                a.distance_to_centroid = vecops::l2_distance(stored->vector, output.centroids[static_cast<size_t>(label)]);
            } else {
                LOG_WARN("Vector ", a.vector_id, " unavailable at save time; distance left null");
            }
        }
        assignments.push_back(std::move(a));
    }

    ClusterResult result;
    result.algorithm = algorithm_name(output.algorithm);
    result.cluster_count = output.cluster_count;
    result.parameters = output.parameters;
    result.silhouette_score = output.silhouette_score;

    summary.cluster_result_id = repository_.save_cluster_run(std::move(result), std::move(assignments));
    LOG_INFO("Cluster result ", summary.cluster_result_id, " saved");
    return summary;
}

} // namespace counselscript
