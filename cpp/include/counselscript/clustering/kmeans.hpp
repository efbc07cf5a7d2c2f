#pragma once

/**
 * Lloyd k-means with k-means++ seeding.
 *
 * n_init independent restarts are run from one seeded generator; the
 * restart with the lowest inertia wins. Identical input and seed give
 * identical output.
 */

#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace counselscript::clustering {

struct KMeansParams {
    int n_init = 10;            // Restarts; best inertia kept
    int max_iter = 300;         // Lloyd iterations per restart
    double tol = 1e-4;          // Relative centroid-shift tolerance
    uint64_t seed = 42;
};

struct KMeansModel {
    std::vector<int> labels;
    Eigen::MatrixXd centroids;  // k x dim
    double inertia = 0.0;       // Sum of squared distances to assigned centroid
    int n_iter = 0;             // Iterations of the winning restart
};

// Requires 1 <= k <= X.rows()
KMeansModel kmeans_fit(const Eigen::MatrixXd& X, int k, const KMeansParams& params = {});

} // namespace counselscript::clustering
