#pragma once

/**
 * HDBSCAN density clustering.
 *
 * Algorithm:
 * 1. Core distance = distance to the min_samples-th nearest point (self included)
 * 2. Mutual reachability max(core_a, core_b, d(a, b) / alpha)
 * 3. Minimum spanning tree (Prim, dense)
 * 4. Single-linkage hierarchy from the sorted MST edges
 * 5. Condensed tree: splits smaller than min_cluster_size fall out as points
 * 6. Excess-of-mass selection of flat clusters (the root is never selected)
 *
 * Points outside every selected cluster are labelled -1 (noise). Labels
 * are numbered in increasing order of condensed-tree cluster id.
 *
 * References:
 * - Campello, Moulavi & Sander, "Density-Based Clustering Based on
 *   Hierarchical Density Estimates", 2013
 */

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace counselscript::clustering {

enum class DistanceMetric {
    Cosine,
    Euclidean
};

const char* metric_name(DistanceMetric metric);

struct HdbscanParams {
    int min_cluster_size = 0;   // 0 = max(5, n / 10)
    int min_samples = 3;        // Includes the point itself
    DistanceMetric metric = DistanceMetric::Cosine;
    double alpha = 1.0;
};

struct CondensedEdge {
    int parent;
    int child;
    double lambda;
    int child_size;
};

struct HdbscanResult {
    std::vector<int> labels;
    int n_clusters = 0;
    int n_noise = 0;
    int min_cluster_size = 0;               // Effective value after defaulting
    std::vector<double> cluster_persistence; // Stability of each selected cluster, label order
    std::vector<CondensedEdge> condensed_tree;
};

Eigen::MatrixXd distance_matrix(const Eigen::MatrixXd& X, DistanceMetric metric);

HdbscanResult hdbscan_fit(const Eigen::MatrixXd& X, const HdbscanParams& params = {});

} // namespace counselscript::clustering
