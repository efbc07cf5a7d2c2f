#pragma once

#include <Eigen/Dense>
#include <vector>

#include "counselscript/clustering/kmeans.hpp"

namespace counselscript::clustering {

// Elbow: k with the largest second difference of inertia
struct ElbowResult {
    int optimal_k = 0;
    std::vector<int> k_values;
    std::vector<double> inertias;
    std::vector<double> second_derivatives;
};

// Gap statistic: log(mean reference inertia) - log(inertia), maximised
struct GapResult {
    int optimal_k = 0;
    std::vector<int> k_values;
    std::vector<double> gaps;
};

// k runs over [k_min, min(k_max, n - 1)]
ElbowResult elbow_method(const Eigen::MatrixXd& X, int k_min, int k_max, const KMeansParams& params = {});

// Reference sets are uniform over the bounding box of X
GapResult gap_statistic(const Eigen::MatrixXd& X, int k_min, int k_max, int n_refs = 10,
                        const KMeansParams& params = {});

} // namespace counselscript::clustering
