#include "counselscript/clustering/clustering_engine.hpp"
#include "counselscript/clustering/metrics.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/thread_pool.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace counselscript {

using clustering::to_matrix;

namespace {

std::vector<Vector> to_vectors(const Eigen::MatrixXd& M) {
    std::vector<Vector> out(static_cast<size_t>(M.rows()));
    for (Eigen::Index r = 0; r < M.rows(); ++r) {
        out[static_cast<size_t>(r)].resize(static_cast<size_t>(M.cols()));
        for (Eigen::Index c = 0; c < M.cols(); ++c) {
            out[static_cast<size_t>(r)][static_cast<size_t>(c)] = static_cast<float>(M(r, c));
        }
    }
    return out;
}

std::vector<PointAssignment> assign_points(const Eigen::MatrixXd& X, const std::vector<int>& labels,
                                           const Eigen::MatrixXd& centroids) {
    std::vector<PointAssignment> out;
    out.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        PointAssignment a;
        a.vector_index = i;
        a.cluster_label = labels[i];
        if (labels[i] >= 0 && labels[i] < centroids.rows()) {
            a.distance_to_centroid = (X.row(static_cast<Eigen::Index>(i)) - centroids.row(labels[i])).norm();
        } else {
            a.distance_to_centroid = std::numeric_limits<double>::infinity();
        }
        out.push_back(a);
    }
    return out;
}

} // namespace

const char* algorithm_name(ClusteringAlgorithm algorithm) {
    return algorithm == ClusteringAlgorithm::KMeans ? "kmeans" : "hdbscan";
}

Outcome<ClusteringAlgorithm> parse_algorithm(const std::string& name) {
    const std::string lower = util::to_lower_ascii(name);
    if (lower == "kmeans") return ClusteringAlgorithm::KMeans;
    if (lower == "hdbscan") return ClusteringAlgorithm::Hdbscan;
    return Outcome<ClusteringAlgorithm>::failure(ErrorCode::INVALID_ARGUMENT,
                                                 "Unsupported clustering algorithm: " + name);
}

ClusteringRequest ClusteringRequest::from_settings(const ClusteringSettings& settings) {
    ClusteringRequest request;
    request.k_min = settings.k_min;
    request.k_max = settings.k_max;
    request.kmeans.n_init = settings.n_init;
    request.kmeans.max_iter = settings.max_iter;
    request.kmeans.seed = settings.seed;
    request.hdbscan.min_samples = settings.hdbscan_min_samples;
    return request;
}

ClusteringEngine::ClusteringEngine(size_t dimension, vecops::DimensionPolicy policy, ThreadPool* pool)
    : dimension_(dimension), policy_(policy), pool_(pool) {
    if (dimension_ == 0) {
        throw InvalidArgumentError("Vector dimension must be positive");
    }
}

Outcome<ClusteringOutput> ClusteringEngine::cluster(const std::vector<Vector>& vectors,
                                                    const ClusteringRequest& request) const {
    auto algorithm = parse_algorithm(request.algorithm);
    if (!algorithm) return algorithm.error();

    if (vectors.size() < 2) {
        return Outcome<ClusteringOutput>::failure(ErrorCode::INVALID_ARGUMENT,
                                                  "Clustering needs at least 2 vectors, got " +
                                                  std::to_string(vectors.size()));
    }
    if (algorithm.value() == ClusteringAlgorithm::KMeans &&
        (request.k_min < 2 || request.k_max < request.k_min)) {
        return Outcome<ClusteringOutput>::failure(ErrorCode::INVALID_ARGUMENT,
                                                  "Invalid k range (" + std::to_string(request.k_min) + ", " +
                                                  std::to_string(request.k_max) + ")");
    }

    std::vector<Vector> conformed = vectors;
    for (size_t i = 0; i < conformed.size(); ++i) {
        if (!vecops::conform_dimension(conformed[i], dimension_, policy_)) {
            return Outcome<ClusteringOutput>::failure(ErrorCode::DIMENSION_MISMATCH,
                                                      "Vector " + std::to_string(i) + " has " +
                                                      std::to_string(vectors[i].size()) + " components, expected " +
                                                      std::to_string(dimension_));
        }
    }

    const auto start = std::chrono::steady_clock::now();
    const Eigen::MatrixXd X = to_matrix(conformed);
    ClusteringOutput output = algorithm.value() == ClusteringAlgorithm::KMeans
        ? run_kmeans(X, request)
        : run_hdbscan(X, request);
    output.algorithm = algorithm.value();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Clustering (", algorithm_name(output.algorithm), ") of ", vectors.size(), " vectors: ",
             output.cluster_count, " clusters, silhouette ", output.silhouette_score, " in ", elapsed, " ms");
    return output;
}

ClusteringOutput ClusteringEngine::run_kmeans(const Eigen::MatrixXd& X, const ClusteringRequest& request) const {
    const int n = static_cast<int>(X.rows());
    const int upper = std::min(request.k_max, n - 1);

    int best_k = request.k_min;
    PerformanceMetrics metrics;

    if (request.auto_select_k && upper >= request.k_min) {
        LOG_INFO("Searching k in [", request.k_min, ", ", upper, "]");
        std::vector<int> ks;
        for (int k = request.k_min; k <= upper; ++k) ks.push_back(k);
        std::vector<std::optional<double>> scores(ks.size());

        auto evaluate = [&](size_t i) {
            auto model = clustering::kmeans_fit(X, ks[i], request.kmeans);
            if (clustering::count_distinct_labels(model.labels) > 1) {
                scores[i] = clustering::silhouette_score(X, model.labels);
            }
        };
        if (pool_) {
            pool_->parallel_for(0, ks.size(), evaluate);
        } else {
            for (size_t i = 0; i < ks.size(); ++i) evaluate(i);
        }

        double best_score = -1.0;
        for (size_t i = 0; i < ks.size(); ++i) {
            if (!scores[i]) continue;
            metrics.scores_by_k[ks[i]] = *scores[i];
            LOG_DEBUG("k=", ks[i], ": silhouette=", *scores[i]);
            if (*scores[i] > best_score) {
                best_score = *scores[i];
                best_k = ks[i];
            }
        }
    }
    best_k = std::min(best_k, n);

    // Refit at the chosen k; nothing from the search survives
    auto model = clustering::kmeans_fit(X, best_k, request.kmeans);

    ClusteringOutput output;
    output.cluster_count = best_k;
    output.labels = model.labels;
    output.centroids = to_vectors(model.centroids);
    output.silhouette_score = clustering::silhouette_score(X, model.labels);
    output.assignments = assign_points(X, model.labels, model.centroids);

    metrics.silhouette_score = output.silhouette_score;
    metrics.inertia = model.inertia;
    metrics.n_iter = model.n_iter;
    if (clustering::count_distinct_labels(model.labels) > 1) {
        metrics.calinski_harabasz = clustering::calinski_harabasz_score(X, model.labels);
    }
    output.performance = std::move(metrics);

    output.parameters = {
        {"n_init", static_cast<std::int64_t>(request.kmeans.n_init)},
        {"max_iter", static_cast<std::int64_t>(request.kmeans.max_iter)},
        {"random_state", static_cast<std::int64_t>(request.kmeans.seed)},
        {"k_min", static_cast<std::int64_t>(request.k_min)},
        {"k_max", static_cast<std::int64_t>(request.k_max)},
        {"auto_select_k", request.auto_select_k},
    };
    return output;
}

ClusteringOutput ClusteringEngine::run_hdbscan(const Eigen::MatrixXd& X, const ClusteringRequest& request) const {
    auto fit = clustering::hdbscan_fit(X, request.hdbscan);

    const Eigen::MatrixXd centroids = clustering::label_centroids(X, fit.labels, fit.n_clusters);

    ClusteringOutput output;
    output.cluster_count = fit.n_clusters;
    output.labels = fit.labels;
    output.centroids = to_vectors(centroids);
    output.silhouette_score = fit.n_clusters > 1 ? clustering::silhouette_score(X, fit.labels) : 0.0;
    output.assignments = assign_points(X, fit.labels, centroids);

    output.performance.silhouette_score = output.silhouette_score;
    output.performance.n_clusters = fit.n_clusters;
    output.performance.n_noise = fit.n_noise;
    output.performance.cluster_persistence = fit.cluster_persistence;

    output.parameters = {
        {"min_cluster_size", static_cast<std::int64_t>(fit.min_cluster_size)},
        {"min_samples", static_cast<std::int64_t>(request.hdbscan.min_samples)},
        {"metric", std::string(clustering::metric_name(request.hdbscan.metric))},
        {"cluster_selection_epsilon", 0.0},
        {"alpha", request.hdbscan.alpha},
    };
    return output;
}

} // namespace counselscript
