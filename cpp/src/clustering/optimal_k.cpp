#include "counselscript/clustering/optimal_k.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace counselscript::clustering {

namespace {

std::vector<int> k_candidates(const Eigen::MatrixXd& X, int k_min, int k_max) {
    COUNSELSCRIPT_CHECK_ARGUMENT(k_min >= 1 && k_max >= k_min, "Invalid k range");
    std::vector<int> ks;
    const int upper = std::min(k_max, static_cast<int>(X.rows()) - 1);
    for (int k = k_min; k <= upper; ++k) ks.push_back(k);
    return ks;
}

} // namespace

ElbowResult elbow_method(const Eigen::MatrixXd& X, int k_min, int k_max, const KMeansParams& params) {
    ElbowResult result;
    result.k_values = k_candidates(X, k_min, k_max);
    if (result.k_values.empty()) {
        result.optimal_k = k_min;
        return result;
    }

    for (int k : result.k_values) {
        result.inertias.push_back(kmeans_fit(X, k, params).inertia);
    }

    if (result.inertias.size() >= 3) {
        for (size_t i = 1; i + 1 < result.inertias.size(); ++i) {
            result.second_derivatives.push_back(result.inertias[i - 1] - 2.0 * result.inertias[i] +
                                                result.inertias[i + 1]);
        }
        auto best = std::max_element(result.second_derivatives.begin(), result.second_derivatives.end());
        result.optimal_k = result.k_values[static_cast<size_t>(best - result.second_derivatives.begin()) + 1];
    } else {
        result.optimal_k = result.k_values.front();
    }

    LOG_DEBUG("Elbow method selected k=", result.optimal_k);
    return result;
}

GapResult gap_statistic(const Eigen::MatrixXd& X, int k_min, int k_max, int n_refs, const KMeansParams& params) {
    COUNSELSCRIPT_CHECK_ARGUMENT(n_refs >= 1, "gap statistic needs at least one reference set");
    GapResult result;
    result.k_values = k_candidates(X, k_min, k_max);
    if (result.k_values.empty()) {
        result.optimal_k = k_min;
        return result;
    }

    const Eigen::RowVectorXd lo = X.colwise().minCoeff();
    const Eigen::RowVectorXd hi = X.colwise().maxCoeff();
    std::mt19937_64 rng(params.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // Floor keeps log() finite when the data fits a k exactly
    constexpr double kInertiaFloor = 1e-12;

    for (int k : result.k_values) {
        double real = std::max(kInertiaFloor, kmeans_fit(X, k, params).inertia);

        double ref_sum = 0.0;
        for (int r = 0; r < n_refs; ++r) {
            Eigen::MatrixXd ref(X.rows(), X.cols());
            for (Eigen::Index i = 0; i < ref.rows(); ++i) {
                for (Eigen::Index j = 0; j < ref.cols(); ++j) {
                    ref(i, j) = lo(j) + unit(rng) * (hi(j) - lo(j));
                }
            }
            KMeansParams ref_params = params;
            ref_params.seed = rng();
            ref_sum += kmeans_fit(ref, k, ref_params).inertia;
        }
        double mean_ref = std::max(kInertiaFloor, ref_sum / n_refs);
        result.gaps.push_back(std::log(mean_ref) - std::log(real));
    }

    auto best = std::max_element(result.gaps.begin(), result.gaps.end());
    result.optimal_k = result.k_values[static_cast<size_t>(best - result.gaps.begin())];
    LOG_DEBUG("Gap statistic selected k=", result.optimal_k);
    return result;
}

} // namespace counselscript::clustering
