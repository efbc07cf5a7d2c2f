#pragma once

/**
 * Internal cluster-quality metrics over row-major point matrices.
 *
 * Points are rows of an Eigen::MatrixXd. Labels < 0 mark noise and are
 * ignored by every metric here.
 */

#include <Eigen/Dense>
#include <vector>

#include "counselscript/types.hpp"

namespace counselscript::clustering {

// Rows = vectors. Every vector must already have the same length.
Eigen::MatrixXd to_matrix(const std::vector<Vector>& vectors);

// Pairwise Euclidean distances (n x n)
Eigen::MatrixXd pairwise_euclidean(const Eigen::MatrixXd& X);

int count_distinct_labels(const std::vector<int>& labels);

/**
 * Mean silhouette over non-noise points, Euclidean metric.
 * s(i) = (b - a) / max(a, b); singleton clusters contribute 0.
 * Returns 0.0 when fewer than 2 clusters exist or every point is its own
 * cluster.
 */
double silhouette_score(const Eigen::MatrixXd& X, const std::vector<int>& labels);

/**
 * Calinski-Harabasz index: between-cluster dispersion over within-cluster
 * dispersion, scaled by (n - k) / (k - 1). 1.0 when within-cluster
 * dispersion is zero; 0.0 when k < 2 or n == k.
 */
double calinski_harabasz_score(const Eigen::MatrixXd& X, const std::vector<int>& labels);

// Coordinate-wise mean of each label's members; row i is label i
Eigen::MatrixXd label_centroids(const Eigen::MatrixXd& X, const std::vector<int>& labels, int n_clusters);

} // namespace counselscript::clustering
