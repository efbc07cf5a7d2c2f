#include "counselscript/analysis/anomaly_detector.hpp"
#include "counselscript/clustering/metrics.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace counselscript {

const char* anomaly_method_name(AnomalyMethod method) {
    return method == AnomalyMethod::IsolationForest ? "isolation_forest" : "lof";
}

Outcome<AnomalyMethod> parse_anomaly_method(const std::string& name) {
    const std::string lower = util::to_lower_ascii(name);
    if (lower == "isolation_forest") return AnomalyMethod::IsolationForest;
    if (lower == "lof") return AnomalyMethod::LocalOutlierFactor;
    return Outcome<AnomalyMethod>::failure(ErrorCode::INVALID_ARGUMENT, "Unknown anomaly method: " + name);
}

namespace analysis {

namespace {

constexpr double kEulerGamma = 0.5772156649;

// ============================================================================
// Isolation tree
// ============================================================================

class IsolationTree {
public:
    IsolationTree(const Eigen::MatrixXd& X, std::vector<Eigen::Index> rows, int height_limit,
                  std::mt19937_64& rng)
        : X_(X) {
        build(std::move(rows), 0, height_limit, rng);
    }

    double path_length(const Eigen::RowVectorXd& x) const {
        int node = 0;
        int depth = 0;
        while (nodes_[node].feature >= 0) {
            const auto& n = nodes_[node];
            node = x(n.feature) < n.split ? n.left : n.right;
            ++depth;
        }
        return depth + average_path_length(static_cast<double>(nodes_[node].size));
    }

private:
    struct Node {
        Eigen::Index feature = -1;
        double split = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;
    };

    int build(std::vector<Eigen::Index> rows, int depth, int height_limit, std::mt19937_64& rng) {
        const int id = static_cast<int>(nodes_.size());
        nodes_.push_back(Node{});
        nodes_[id].size = rows.size();
        if (depth >= height_limit || rows.size() <= 1) return id;

        // Random feature that is not constant on this node
        std::uniform_int_distribution<Eigen::Index> pick_feature(0, X_.cols() - 1);
        Eigen::Index feature = -1;
        double lo = 0.0, hi = 0.0;
        for (Eigen::Index attempt = 0; attempt < X_.cols(); ++attempt) {
            const Eigen::Index f = pick_feature(rng);
            lo = hi = X_(rows.front(), f);
            for (auto r : rows) {
                lo = std::min(lo, X_(r, f));
                hi = std::max(hi, X_(r, f));
            }
            if (hi > lo) {
                feature = f;
                break;
            }
        }
        if (feature < 0) return id;

        std::uniform_real_distribution<double> pick_split(lo, hi);
        const double split = pick_split(rng);

        std::vector<Eigen::Index> left, right;
        for (auto r : rows) {
            (X_(r, feature) < split ? left : right).push_back(r);
        }
        if (left.empty() || right.empty()) return id;

        nodes_[id].feature = feature;
        nodes_[id].split = split;
        const int l = build(std::move(left), depth + 1, height_limit, rng);
        const int r = build(std::move(right), depth + 1, height_limit, rng);
        nodes_[id].left = l;
        nodes_[id].right = r;
        return id;
    }

    const Eigen::MatrixXd& X_;
    std::vector<Node> nodes_;
};

double cosine_distance(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    const double na = a.norm();
    const double nb = b.norm();
    if (na == 0.0 || nb == 0.0) return 1.0;
    return 1.0 - a.dot(b) / (na * nb);
}

} // namespace

double average_path_length(double n) {
    if (n <= 1.0) return 0.0;
    if (n <= 2.0) return 1.0;
    return 2.0 * (std::log(n - 1.0) + kEulerGamma) - 2.0 * (n - 1.0) / n;
}

Eigen::MatrixXd standardize(const Eigen::MatrixXd& X) {
    Eigen::MatrixXd Z = X;
    if (X.rows() == 0) return Z;
    const Eigen::RowVectorXd mean = X.colwise().mean();
    Z.rowwise() -= mean;
    for (Eigen::Index c = 0; c < Z.cols(); ++c) {
        const double sd = std::sqrt(Z.col(c).squaredNorm() / static_cast<double>(Z.rows()));
        if (sd > 0.0) Z.col(c) /= sd;
    }
    return Z;
}

std::vector<double> isolation_forest_scores(const Eigen::MatrixXd& X, const IsolationForestParams& params) {
    const Eigen::Index n = X.rows();
    std::vector<double> scores(static_cast<size_t>(n), 0.0);
    if (n == 0 || params.n_estimators <= 0) return scores;

    const Eigen::Index psi = std::min<Eigen::Index>(std::max(1, params.max_samples), n);
    const int height_limit = static_cast<int>(std::ceil(std::log2(std::max<double>(2.0, psi))));

    std::mt19937_64 rng(params.seed);
    std::vector<Eigen::Index> all(static_cast<size_t>(n));
    std::iota(all.begin(), all.end(), Eigen::Index{0});

    std::vector<double> depth_sum(static_cast<size_t>(n), 0.0);
    for (int t = 0; t < params.n_estimators; ++t) {
        std::shuffle(all.begin(), all.end(), rng);
        std::vector<Eigen::Index> sample(all.begin(), all.begin() + psi);
        IsolationTree tree(X, std::move(sample), height_limit, rng);
        for (Eigen::Index i = 0; i < n; ++i) {
            depth_sum[static_cast<size_t>(i)] += tree.path_length(X.row(i));
        }
    }

    const double c = average_path_length(static_cast<double>(psi));
    for (size_t i = 0; i < scores.size(); ++i) {
        const double mean_depth = depth_sum[i] / params.n_estimators;
        const double s = c > 0.0 ? std::pow(2.0, -mean_depth / c) : 0.5;
        scores[i] = -s;
    }
    return scores;
}

std::vector<double> local_outlier_factor(const Eigen::MatrixXd& X, int n_neighbors) {
    const size_t n = static_cast<size_t>(X.rows());
    std::vector<double> lof(n, 1.0);
    if (n < 2) return lof;

    const size_t k = std::clamp<size_t>(static_cast<size_t>(std::max(1, n_neighbors)), 1, n - 1);
    const Eigen::MatrixXd D = clustering::pairwise_euclidean(X);

    std::vector<std::vector<size_t>> neighbors(n);
    std::vector<double> k_distance(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        std::vector<size_t> order;
        order.reserve(n - 1);
        for (size_t j = 0; j < n; ++j) {
            if (j != i) order.push_back(j);
        }
        std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
                          [&](size_t a, size_t b) {
                              const double da = D(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(a));
                              const double db = D(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(b));
                              return da != db ? da < db : a < b;
                          });
        order.resize(k);
        k_distance[i] = D(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(order.back()));
        neighbors[i] = std::move(order);
    }

    std::vector<double> lrd(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        double reach_sum = 0.0;
        for (size_t j : neighbors[i]) {
            reach_sum += std::max(k_distance[j], D(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)));
        }
        lrd[i] = 1.0 / (reach_sum / static_cast<double>(k) + 1e-10);
    }

    for (size_t i = 0; i < n; ++i) {
        double neighbor_lrd = 0.0;
        for (size_t j : neighbors[i]) neighbor_lrd += lrd[j];
        lof[i] = neighbor_lrd / static_cast<double>(k) / lrd[i];
    }
    return lof;
}

double percentile(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const double pos = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    return values[lo] + (values[hi] - values[lo]) * (pos - static_cast<double>(lo));
}

} // namespace analysis

// ============================================================================
// AnomalyDetector
// ============================================================================

namespace {

SummaryStats summarize(const std::vector<double>& values) {
    SummaryStats s;
    if (values.empty()) return s;
    s.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double var = 0.0;
    for (double v : values) var += (v - s.mean) * (v - s.mean);
    s.stddev = std::sqrt(var / static_cast<double>(values.size()));
    return s;
}

Eigen::VectorXd as_eigen(const Vector& v) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(v.size()));
    for (size_t i = 0; i < v.size(); ++i) out(static_cast<Eigen::Index>(i)) = v[i];
    return out;
}

} // namespace

AnomalyDetector::AnomalyDetector(AnomalySettings settings, size_t dimension, vecops::DimensionPolicy policy)
    : settings_(settings), dimension_(dimension), policy_(policy) {
    if (!(settings_.contamination > 0.0 && settings_.contamination <= 0.5)) {
        throw InvalidArgumentError("Contamination must be in (0, 0.5]");
    }
    if (dimension_ == 0) {
        throw InvalidArgumentError("Vector dimension must be positive");
    }
}

Outcome<AnomalyReport> AnomalyDetector::detect(const std::vector<SuccessVectorRecord>& records,
                                               AnomalyMethod method) const {
    if (records.size() < 2) {
        return Outcome<AnomalyReport>::failure(ErrorCode::INVALID_ARGUMENT,
                                               "Anomaly detection needs at least 2 vectors, got " +
                                               std::to_string(records.size()));
    }
    std::vector<SuccessVectorRecord> conformed = records;
    for (auto& r : conformed) {
        const size_t given = r.vector.size();
        if (!vecops::conform_dimension(r.vector, dimension_, policy_)) {
            return Outcome<AnomalyReport>::failure(ErrorCode::DIMENSION_MISMATCH,
                                                   "Vector " + r.id + " has " + std::to_string(given) +
                                                   " components, expected " + std::to_string(dimension_));
        }
    }

    LOG_INFO("Anomaly detection (", anomaly_method_name(method), ") over ", records.size(), " conversations");

    std::vector<Vector> vectors;
    vectors.reserve(conformed.size());
    for (const auto& r : conformed) vectors.push_back(r.vector);
    const Eigen::MatrixXd Z = analysis::standardize(clustering::to_matrix(vectors));

    AnomalyReport report;
    report.method = method;
    report.contamination = settings_.contamination;
    report.total_conversations = records.size();
    for (const auto& r : records) report.vector_ids.push_back(r.id);

    if (method == AnomalyMethod::IsolationForest) {
        analysis::IsolationForestParams params;
        params.n_estimators = settings_.n_estimators;
        params.seed = settings_.seed;
        report.scores = analysis::isolation_forest_scores(Z, params);
    } else {
        const int n = static_cast<int>(records.size());
        const int n_neighbors = std::max(1, std::min(20, n / 5));
        report.scores = analysis::local_outlier_factor(Z, n_neighbors);
        for (auto& s : report.scores) s = -s;
    }

    report.threshold = analysis::percentile(report.scores, settings_.contamination * 100.0);
    for (size_t i = 0; i < report.scores.size(); ++i) {
        if (report.scores[i] < report.threshold) report.outlier_indices.push_back(i);
    }

    if (!report.outlier_indices.empty()) {
        report.analysis = analyze(conformed, report.outlier_indices);
    }
    LOG_INFO("Anomaly detection flagged ", report.outlier_indices.size(), " special success cases");
    return report;
}

AnomalyAnalysis AnomalyDetector::analyze(const std::vector<SuccessVectorRecord>& records,
                                         const std::vector<size_t>& outliers) const {
    std::vector<bool> is_outlier(records.size(), false);
    for (size_t i : outliers) is_outlier[i] = true;

    std::vector<double> normal_rates, outlier_rates, normal_lengths, outlier_lengths;
    Eigen::VectorXd centroid = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(records.front().vector.size()));
    size_t normal_count = 0;

    for (size_t i = 0; i < records.size(); ++i) {
        const auto rate = attribute_as_double(records[i].metadata, "success_rate");
        const double length = static_cast<double>(util::codepoint_length(records[i].chunk_text));
        if (is_outlier[i]) {
            if (rate) outlier_rates.push_back(*rate);
            outlier_lengths.push_back(length);
        } else {
            if (rate) normal_rates.push_back(*rate);
            normal_lengths.push_back(length);
            centroid += as_eigen(records[i].vector);
            ++normal_count;
        }
    }
    if (normal_count > 0) centroid /= static_cast<double>(normal_count);

    AnomalyAnalysis out;
    out.outlier_count = outliers.size();
    out.normal_success_rate = summarize(normal_rates);
    out.outlier_success_rate = summarize(outlier_rates);
    out.normal_length = summarize(normal_lengths);
    out.outlier_length = summarize(outlier_lengths);

    double distance_sum = 0.0;
    out.min_distance_to_centroid = std::numeric_limits<double>::max();
    for (size_t i : outliers) {
        const auto& r = records[i];
        OutlierDetail d;
        d.index = i;
        d.vector_id = r.id;
        d.session_id = r.session_id;
        d.success_rate = attribute_as_double(r.metadata, "success_rate");
        d.distance_to_centroid = analysis::cosine_distance(centroid, as_eigen(r.vector));
        d.text_preview = util::utf8_prefix(r.chunk_text, 200) + "...";

        distance_sum += d.distance_to_centroid;
        out.max_distance_to_centroid = std::max(out.max_distance_to_centroid, d.distance_to_centroid);
        out.min_distance_to_centroid = std::min(out.min_distance_to_centroid, d.distance_to_centroid);

        if (d.success_rate && *d.success_rate > 0.9) {
            out.special.high_success_outliers.push_back({r.id, r.session_id, *d.success_rate,
                                                         "exceptional_success_pattern"});
        }
        if (d.success_rate && *d.success_rate < 0.5) {
            out.special.low_success_outliers.push_back({r.id, r.session_id, *d.success_rate,
                                                        "unusual_success_despite_low_rate"});
        }
        const size_t length = util::codepoint_length(r.chunk_text);
        if (length > 5000 || length < 200) {
            out.special.unusual_length_patterns.push_back({r.id, r.session_id, static_cast<double>(length),
                                                           length > 5000 ? "very_long" : "very_short"});
        }
        out.outliers.push_back(std::move(d));
    }
    out.avg_distance_to_centroid = distance_sum / static_cast<double>(outliers.size());
    return out;
}

AnomalyInsights AnomalyDetector::insights(const AnomalyReport& report) {
    AnomalyInsights out;
    if (report.analysis) {
        const auto& a = *report.analysis;
        if (!a.special.high_success_outliers.empty()) {
            out.insights.push_back(std::to_string(a.special.high_success_outliers.size()) +
                                   " special success cases with an exceptionally high success rate (over 90%) "
                                   "were found. Studying their approach in detail may reveal new success patterns.");
        }
        if (a.avg_distance_to_centroid > 0.3) {
            out.insights.push_back("The detected special success cases lie far from the common success pattern. "
                                   "They may reflect a distinctive approach or unusual circumstances.");
        }
        const double outlier_avg = a.outlier_success_rate.mean;
        const double normal_avg = a.normal_success_rate.mean;
        if (outlier_avg > normal_avg * 1.1) {
            out.insights.push_back("Special success cases have a higher average success rate than typical ones, "
                                   "which suggests an innovative approach.");
        } else if (outlier_avg < normal_avg * 0.9) {
            out.insights.push_back("Some special success cases have a low success rate but are labelled successful; "
                                   "they may value outcomes other than closing, such as customer satisfaction.");
        }
    }
    out.recommendations = {
        "Analyze each special success case individually to identify its unique success factors",
        "Extract new success patterns from the high-success-rate special cases",
        "Consider whether the special cases' approach can be generalized",
        "Fold what was learned from the outliers into the standard script",
    };
    return out;
}

// ============================================================================
// AnomalyDetectionService
// ============================================================================

AnomalyDetectionService::AnomalyDetectionService(const VectorStore& store, ClusterRepository& repository,
                                                 const AnomalyDetector& detector)
    : store_(store), repository_(repository), detector_(detector) {}

Outcome<AnomalyReport> AnomalyDetectionService::run(AnomalyMethod method, const VectorFilter& filter) {
    auto records = store_.get_success_vectors(filter);
    auto report = detector_.detect(records, method);
    if (!report) return report.error();

    const auto& r = report.value();
    std::vector<bool> flagged(r.scores.size(), false);
    for (size_t i : r.outlier_indices) flagged[i] = true;

    Attributes parameters{
        {"contamination", r.contamination},
        {"threshold", r.threshold},
    };
    if (method == AnomalyMethod::IsolationForest) {
        parameters["n_estimators"] = static_cast<std::int64_t>(detector_.settings().n_estimators);
        parameters["random_state"] = static_cast<std::int64_t>(detector_.settings().seed);
    } else {
        parameters["n_neighbors"] = static_cast<std::int64_t>(
            std::max(1, std::min(20, static_cast<int>(records.size()) / 5)));
    }

    std::vector<AnomalyResult> rows;
    rows.reserve(r.scores.size());
    for (size_t i = 0; i < r.scores.size(); ++i) {
        rows.push_back({r.vector_ids[i], anomaly_method_name(method), r.scores[i], flagged[i], parameters});
    }
    repository_.save_anomaly_results(rows);
    return report;
}

} // namespace counselscript
