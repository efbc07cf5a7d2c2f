#include "counselscript/clustering/kmeans.hpp"
#include "counselscript/error.hpp"

#include <algorithm>
#include <limits>
#include <random>

namespace counselscript::clustering {

namespace {

Eigen::MatrixXd kmeans_plus_plus(const Eigen::MatrixXd& X, int k, std::mt19937_64& rng) {
    const Eigen::Index n = X.rows();
    Eigen::MatrixXd C(k, X.cols());

    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
    C.row(0) = X.row(pick(rng));

    Eigen::VectorXd closest = (X.rowwise() - C.row(0)).rowwise().squaredNorm();
    for (int c = 1; c < k; ++c) {
        const double total = closest.sum();
        Eigen::Index chosen = 0;
        if (total > 0.0) {
            std::uniform_real_distribution<double> u(0.0, total);
            double target = u(rng);
            double acc = 0.0;
            chosen = n - 1;
            for (Eigen::Index i = 0; i < n; ++i) {
                acc += closest(i);
                if (acc >= target && closest(i) > 0.0) {
                    chosen = i;
                    break;
                }
            }
        } else {
            // All points coincide with a centroid already
            chosen = pick(rng);
        }
        C.row(c) = X.row(chosen);
        closest = closest.cwiseMin((X.rowwise() - C.row(c)).rowwise().squaredNorm());
    }
    return C;
}

// Returns inertia
double assign(const Eigen::MatrixXd& X, const Eigen::MatrixXd& C, std::vector<int>& labels,
              Eigen::VectorXd& dist) {
    const Eigen::VectorXd xsq = X.rowwise().squaredNorm();
    const Eigen::VectorXd csq = C.rowwise().squaredNorm();
    const Eigen::MatrixXd cross = X * C.transpose();

    double inertia = 0.0;
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        double best = std::numeric_limits<double>::infinity();
        int best_c = 0;
        for (Eigen::Index c = 0; c < C.rows(); ++c) {
            double d = std::max(0.0, xsq(i) - 2.0 * cross(i, c) + csq(c));
            if (d < best) {
                best = d;
                best_c = static_cast<int>(c);
            }
        }
        labels[static_cast<size_t>(i)] = best_c;
        dist(i) = best;
        inertia += best;
    }
    return inertia;
}

KMeansModel single_run(const Eigen::MatrixXd& X, int k, const KMeansParams& params,
                       double tolerance, std::mt19937_64& rng) {
    const Eigen::Index n = X.rows();
    KMeansModel model;
    model.centroids = kmeans_plus_plus(X, k, rng);
    model.labels.assign(static_cast<size_t>(n), 0);
    Eigen::VectorXd dist(n);

    for (int iter = 1; iter <= std::max(1, params.max_iter); ++iter) {
        assign(X, model.centroids, model.labels, dist);

        Eigen::MatrixXd next = Eigen::MatrixXd::Zero(k, X.cols());
        std::vector<int> counts(static_cast<size_t>(k), 0);
        for (Eigen::Index i = 0; i < n; ++i) {
            int l = model.labels[static_cast<size_t>(i)];
            next.row(l) += X.row(i);
            ++counts[static_cast<size_t>(l)];
        }
        for (int c = 0; c < k; ++c) {
            if (counts[static_cast<size_t>(c)] > 0) {
                next.row(c) /= counts[static_cast<size_t>(c)];
            } else {
                // Empty cluster: relocate to the point farthest from its centroid
                Eigen::Index far = 0;
                dist.maxCoeff(&far);
                next.row(c) = X.row(far);
                dist(far) = 0.0;
            }
        }

        double shift = (next - model.centroids).squaredNorm();
        model.centroids = std::move(next);
        model.n_iter = iter;
        if (shift <= tolerance) break;
    }

    model.inertia = assign(X, model.centroids, model.labels, dist);
    return model;
}

} // namespace

KMeansModel kmeans_fit(const Eigen::MatrixXd& X, int k, const KMeansParams& params) {
    COUNSELSCRIPT_CHECK_ARGUMENT(k >= 1, "k must be at least 1");
    COUNSELSCRIPT_CHECK_ARGUMENT(X.rows() >= k, "k-means needs at least k points");

    // Tolerance relative to the mean per-feature variance
    const Eigen::RowVectorXd mean = X.colwise().mean();
    const double variance = (X.rowwise() - mean).array().square().colwise().mean().mean();
    const double tolerance = params.tol * variance;

    std::mt19937_64 rng(params.seed);
    KMeansModel best;
    best.inertia = std::numeric_limits<double>::infinity();
    for (int run = 0; run < std::max(1, params.n_init); ++run) {
        KMeansModel model = single_run(X, k, params, tolerance, rng);
        if (model.inertia < best.inertia) {
            best = std::move(model);
        }
    }
    return best;
}

} // namespace counselscript::clustering
