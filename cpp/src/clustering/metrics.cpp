#include "counselscript/clustering/metrics.hpp"
#include "counselscript/error.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace counselscript::clustering {

Eigen::MatrixXd to_matrix(const std::vector<Vector>& vectors) {
    if (vectors.empty()) return Eigen::MatrixXd(0, 0);
    const Eigen::Index dim = static_cast<Eigen::Index>(vectors.front().size());
    Eigen::MatrixXd X(static_cast<Eigen::Index>(vectors.size()), dim);
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (static_cast<Eigen::Index>(vectors[i].size()) != dim) {
            COUNSELSCRIPT_THROW(ErrorCode::DIMENSION_MISMATCH,
                                "Vector " + std::to_string(i) + " has " +
                                std::to_string(vectors[i].size()) + " components, expected " +
                                std::to_string(dim));
        }
        X.row(static_cast<Eigen::Index>(i)) =
            Eigen::Map<const Eigen::VectorXf>(vectors[i].data(), dim).cast<double>().transpose();
    }
    return X;
}

Eigen::MatrixXd pairwise_euclidean(const Eigen::MatrixXd& X) {
    const Eigen::VectorXd sq = X.rowwise().squaredNorm();
    Eigen::MatrixXd D = (-2.0 * X * X.transpose()).colwise() + sq;
    D.rowwise() += sq.transpose();
    D = D.cwiseMax(0.0).cwiseSqrt();
    D.diagonal().setZero();
    return D;
}

int count_distinct_labels(const std::vector<int>& labels) {
    std::set<int> distinct;
    for (int l : labels) {
        if (l >= 0) distinct.insert(l);
    }
    return static_cast<int>(distinct.size());
}

double silhouette_score(const Eigen::MatrixXd& X, const std::vector<int>& labels) {
    std::vector<Eigen::Index> idx;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] >= 0) idx.push_back(static_cast<Eigen::Index>(i));
    }
    const int n_clusters = count_distinct_labels(labels);
    if (n_clusters < 2 || n_clusters >= static_cast<int>(idx.size())) {
        return 0.0;
    }

    Eigen::MatrixXd sub(static_cast<Eigen::Index>(idx.size()), X.cols());
    std::vector<int> sub_labels(idx.size());
    for (size_t i = 0; i < idx.size(); ++i) {
        sub.row(static_cast<Eigen::Index>(i)) = X.row(idx[i]);
        sub_labels[i] = labels[static_cast<size_t>(idx[i])];
    }
    const Eigen::MatrixXd D = pairwise_euclidean(sub);

    std::map<int, size_t> sizes;
    for (int l : sub_labels) ++sizes[l];

    double total = 0.0;
    const size_t n = sub_labels.size();
    for (size_t i = 0; i < n; ++i) {
        std::map<int, double> sums;
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            sums[sub_labels[j]] += D(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
        }
        const int own = sub_labels[i];
        if (sizes[own] <= 1) continue;  // singleton: s = 0

        double a = sums[own] / static_cast<double>(sizes[own] - 1);
        double b = std::numeric_limits<double>::infinity();
        for (const auto& [label, size] : sizes) {
            if (label == own) continue;
            b = std::min(b, sums[label] / static_cast<double>(size));
        }
        double denom = std::max(a, b);
        if (denom > 0.0) total += (b - a) / denom;
    }
    return total / static_cast<double>(n);
}

double calinski_harabasz_score(const Eigen::MatrixXd& X, const std::vector<int>& labels) {
    const int k = count_distinct_labels(labels);
    const auto n = static_cast<int>(X.rows());
    if (k < 2 || n == k) return 0.0;

    std::map<int, std::vector<Eigen::Index>> members;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] >= 0) members[labels[i]].push_back(static_cast<Eigen::Index>(i));
    }

    const Eigen::RowVectorXd mean = X.colwise().mean();
    double between = 0.0;
    double within = 0.0;
    for (const auto& [label, rows] : members) {
        Eigen::RowVectorXd c = Eigen::RowVectorXd::Zero(X.cols());
        for (auto r : rows) c += X.row(r);
        c /= static_cast<double>(rows.size());
        between += static_cast<double>(rows.size()) * (c - mean).squaredNorm();
        for (auto r : rows) within += (X.row(r) - c).squaredNorm();
    }
    if (within == 0.0) return 1.0;
    return between * (n - k) / (within * (k - 1));
}

Eigen::MatrixXd label_centroids(const Eigen::MatrixXd& X, const std::vector<int>& labels, int n_clusters) {
    Eigen::MatrixXd C = Eigen::MatrixXd::Zero(n_clusters, X.cols());
    std::vector<int> counts(static_cast<size_t>(n_clusters), 0);
    for (size_t i = 0; i < labels.size(); ++i) {
        int l = labels[i];
        if (l < 0 || l >= n_clusters) continue;
        C.row(l) += X.row(static_cast<Eigen::Index>(i));
        ++counts[static_cast<size_t>(l)];
    }
    for (int c = 0; c < n_clusters; ++c) {
        if (counts[static_cast<size_t>(c)] > 0) C.row(c) /= counts[static_cast<size_t>(c)];
    }
    return C;
}

} // namespace counselscript::clustering
