#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "counselscript/config.hpp"
#include "counselscript/error.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include "counselscript/vector_ops.hpp"

namespace counselscript {

enum class AnomalyMethod { IsolationForest, LocalOutlierFactor };

const char* anomaly_method_name(AnomalyMethod method);

// "isolation_forest" or "lof"
Outcome<AnomalyMethod> parse_anomaly_method(const std::string& name);

namespace analysis {

struct IsolationForestParams {
    int n_estimators = 100;
    int max_samples = 256;          // capped at the row count
    std::uint64_t seed = 42;
};

// Column-wise z-scores; constant columns are left centred
Eigen::MatrixXd standardize(const Eigen::MatrixXd& X);

// Negated anomaly score per row: -2^(-E[h(x)] / c(psi)). Lower is more anomalous.
std::vector<double> isolation_forest_scores(const Eigen::MatrixXd& X, const IsolationForestParams& params);

// Local outlier factor per row (about 1 for inliers, larger for outliers)
std::vector<double> local_outlier_factor(const Eigen::MatrixXd& X, int n_neighbors);

// Linear-interpolation percentile, q in [0, 100]
double percentile(std::vector<double> values, double q);

// Average path length of an unsuccessful BST search over n points
double average_path_length(double n);

} // namespace analysis

struct SummaryStats {
    double mean = 0.0;
    double stddev = 0.0;        // population
};

struct OutlierDetail {
    size_t index = 0;
    std::string vector_id;
    std::string session_id;
    std::optional<double> success_rate;
    double distance_to_centroid = 0.0;      // cosine distance to the inlier centroid
    std::string text_preview;
};

struct SpecialCase {
    std::string vector_id;
    std::string session_id;
    double value = 0.0;
    std::string factor;
};

struct SpecialCharacteristics {
    std::vector<SpecialCase> high_success_outliers;     // success_rate > 0.9
    std::vector<SpecialCase> low_success_outliers;      // success_rate < 0.5
    std::vector<SpecialCase> unusual_length_patterns;   // > 5000 or < 200 characters
};

struct AnomalyAnalysis {
    size_t outlier_count = 0;
    SummaryStats normal_success_rate;
    SummaryStats outlier_success_rate;
    SummaryStats normal_length;
    SummaryStats outlier_length;
    double avg_distance_to_centroid = 0.0;
    double max_distance_to_centroid = 0.0;
    double min_distance_to_centroid = 0.0;
    SpecialCharacteristics special;
    std::vector<OutlierDetail> outliers;
};

struct AnomalyReport {
    AnomalyMethod method = AnomalyMethod::IsolationForest;
    double contamination = 0.1;
    size_t total_conversations = 0;
    std::vector<std::string> vector_ids;     // input order
    std::vector<double> scores;              // lower is more anomalous
    double threshold = 0.0;
    std::vector<size_t> outlier_indices;
    std::optional<AnomalyAnalysis> analysis; // empty when nothing was flagged
};

struct AnomalyInsights {
    std::vector<std::string> insights;
    std::vector<std::string> recommendations;
};

/**
 * Outlier detection over the successful-conversation set.
 *
 * Vectors are standardised, scored by Isolation Forest or LOF, and every
 * row whose score falls below the contamination percentile is flagged.
 * The comparison of outliers against inliers uses the raw vectors and the
 * "success_rate" metadata attribute where records carry one.
 * Every vector is conformed to the configured dimension before scoring.
 */
class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalySettings settings = {}, size_t dimension = 1536,
                             vecops::DimensionPolicy policy = vecops::DimensionPolicy::Reject);

    Outcome<AnomalyReport> detect(const std::vector<SuccessVectorRecord>& records,
                                  AnomalyMethod method = AnomalyMethod::IsolationForest) const;

    static AnomalyInsights insights(const AnomalyReport& report);

    const AnomalySettings& settings() const { return settings_; }
    size_t dimension() const { return dimension_; }
    vecops::DimensionPolicy policy() const { return policy_; }

private:
    AnomalyAnalysis analyze(const std::vector<SuccessVectorRecord>& records,
                            const std::vector<size_t>& outliers) const;

    AnomalySettings settings_;
    size_t dimension_;
    vecops::DimensionPolicy policy_;
};

// Fetches the vectors, runs the detector and stores one AnomalyResult per record
class AnomalyDetectionService {
public:
    AnomalyDetectionService(const VectorStore& store, ClusterRepository& repository,
                            const AnomalyDetector& detector);

    Outcome<AnomalyReport> run(AnomalyMethod method, const VectorFilter& filter = VectorFilter{});

private:
    const VectorStore& store_;
    ClusterRepository& repository_;
    const AnomalyDetector& detector_;
};

} // namespace counselscript
