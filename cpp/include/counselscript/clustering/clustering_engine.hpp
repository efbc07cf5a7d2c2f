#pragma once

/**
 * Clustering of success vectors.
 *
 * kmeans: searches k over [k_min, min(k_max, n - 1)] for the highest
 * silhouette (ties keep the smaller k), then refits once at that k. With
 * auto_select_k off, k_min is used directly.
 *
 * hdbscan: density clustering; label -1 is noise and is not counted in
 * cluster_count. Centroids are member means.
 *
 * Distances to centroid are Euclidean; noise points get +infinity.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "counselscript/clustering/hdbscan.hpp"
#include "counselscript/clustering/kmeans.hpp"
#include "counselscript/config.hpp"
#include "counselscript/error.hpp"
#include "counselscript/types.hpp"
#include "counselscript/vector_ops.hpp"

namespace counselscript {

class ThreadPool;

enum class ClusteringAlgorithm {
    KMeans,
    Hdbscan
};

const char* algorithm_name(ClusteringAlgorithm algorithm);

// "kmeans" or "hdbscan" (case-insensitive)
Outcome<ClusteringAlgorithm> parse_algorithm(const std::string& name);

struct ClusteringRequest {
    std::string algorithm = "kmeans";
    int k_min = 2;
    int k_max = 15;
    bool auto_select_k = true;
    clustering::KMeansParams kmeans;
    clustering::HdbscanParams hdbscan;

    static ClusteringRequest from_settings(const ClusteringSettings& settings);
};

struct PointAssignment {
    size_t vector_index = 0;
    int cluster_label = -1;
    double distance_to_centroid = 0.0;
};

struct PerformanceMetrics {
    double silhouette_score = 0.0;
    std::optional<double> inertia;
    std::optional<int> n_iter;
    std::map<int, double> scores_by_k;      // kmeans search only
    std::optional<double> calinski_harabasz;
    std::optional<int> n_clusters;          // hdbscan
    std::optional<int> n_noise;             // hdbscan
    std::vector<double> cluster_persistence;
};

struct ClusteringOutput {
    ClusteringAlgorithm algorithm = ClusteringAlgorithm::KMeans;
    int cluster_count = 0;
    std::vector<int> labels;
    std::vector<Vector> centroids;          // index = cluster label
    double silhouette_score = 0.0;
    std::vector<PointAssignment> assignments;
    PerformanceMetrics performance;
    Attributes parameters;
};

class ClusteringEngine {
public:
    // pool (optional, not owned) parallelises the k search
    explicit ClusteringEngine(size_t dimension = 1536,
                              vecops::DimensionPolicy policy = vecops::DimensionPolicy::Reject,
                              ThreadPool* pool = nullptr);

    // Input errors (fewer than 2 vectors, bad k range, unknown algorithm,
    // wrong dimension under Reject) come back as Error, never thrown.
    Outcome<ClusteringOutput> cluster(const std::vector<Vector>& vectors,
                                      const ClusteringRequest& request) const;

    size_t dimension() const { return dimension_; }
    vecops::DimensionPolicy policy() const { return policy_; }

private:
    ClusteringOutput run_kmeans(const Eigen::MatrixXd& X, const ClusteringRequest& request) const;
    ClusteringOutput run_hdbscan(const Eigen::MatrixXd& X, const ClusteringRequest& request) const;

    size_t dimension_;
    vecops::DimensionPolicy policy_;
    ThreadPool* pool_;
};

} // namespace counselscript
