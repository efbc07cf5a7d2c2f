// =============================================================================
// Anomaly Detection Tests
// =============================================================================

#include <gtest/gtest.h>
#include "counselscript/analysis/anomaly_detector.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace counselscript;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    static constexpr size_t kDim = 3;

    void SetUp() override {
        // Twenty similar conversations and one far away
        for (int i = 0; i < 20; ++i) {
            float d = 0.01f * static_cast<float>(i);
            records.push_back(make_record("r" + std::to_string(i), {1.0f + d, 1.0f - d, 0.5f + d * 0.5f},
                                          std::string(300, 'a'), 0.7));
        }
        records.push_back(make_record("far", {9.0f, -7.0f, 6.0f}, std::string(6000, 'b'), 0.95));
    }

    static SuccessVectorRecord make_record(const std::string& id, Vector v, const std::string& text,
                                           std::optional<double> success_rate) {
        SuccessVectorRecord r;
        r.id = id;
        r.session_id = "s-" + id;
        r.chunk_text = text;
        r.vector = std::move(v);
        if (success_rate) r.metadata["success_rate"] = *success_rate;
        return r;
    }

    size_t far_index() const { return records.size() - 1; }

    std::vector<SuccessVectorRecord> records;
};

TEST_F(AnomalyDetectorTest, ContaminationIsValidated) {
    AnomalySettings bad;
    bad.contamination = 0.0;
    EXPECT_THROW(AnomalyDetector{bad}, InvalidArgumentError);
    bad.contamination = 0.6;
    EXPECT_THROW(AnomalyDetector{bad}, InvalidArgumentError);
}

TEST_F(AnomalyDetectorTest, IsolationForestFlagsFarPoint) {
    AnomalyDetector detector({}, kDim);
    auto report = detector.detect(records, AnomalyMethod::IsolationForest);
    ASSERT_TRUE(report.ok()) << report.error().message;

    const auto& r = report.value();
    EXPECT_EQ(r.total_conversations, records.size());
    ASSERT_EQ(r.scores.size(), records.size());
    EXPECT_FALSE(r.outlier_indices.empty());
    EXPECT_LE(r.outlier_indices.size(), 3u);
    EXPECT_NE(std::find(r.outlier_indices.begin(), r.outlier_indices.end(), far_index()),
              r.outlier_indices.end());

    // Lower is more anomalous
    EXPECT_EQ(std::min_element(r.scores.begin(), r.scores.end()) - r.scores.begin(),
              static_cast<std::ptrdiff_t>(far_index()));
    for (size_t i : r.outlier_indices) EXPECT_LT(r.scores[i], r.threshold);
}

TEST_F(AnomalyDetectorTest, LocalOutlierFactorFlagsFarPoint) {
    AnomalyDetector detector({}, kDim);
    auto report = detector.detect(records, AnomalyMethod::LocalOutlierFactor);
    ASSERT_TRUE(report.ok());
    const auto& r = report.value();
    EXPECT_NE(std::find(r.outlier_indices.begin(), r.outlier_indices.end(), far_index()),
              r.outlier_indices.end());
    EXPECT_EQ(r.method, AnomalyMethod::LocalOutlierFactor);
}

TEST_F(AnomalyDetectorTest, SameSeedSameScores) {
    AnomalyDetector detector({}, kDim);
    auto a = detector.detect(records);
    auto b = detector.detect(records);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value().scores, b.value().scores);
}

TEST_F(AnomalyDetectorTest, AnalysisFindsSpecialCharacteristics) {
    AnomalyDetector detector({}, kDim);
    auto report = detector.detect(records);
    ASSERT_TRUE(report.ok());
    ASSERT_TRUE(report.value().analysis.has_value());

    const auto& a = *report.value().analysis;
    EXPECT_EQ(a.outlier_count, report.value().outlier_indices.size());
    EXPECT_NEAR(a.normal_success_rate.mean, 0.7, 1e-9);

    bool far_high = false;
    for (const auto& c : a.special.high_success_outliers) far_high |= c.vector_id == "far";
    EXPECT_TRUE(far_high);

    bool far_long = false;
    for (const auto& c : a.special.unusual_length_patterns) far_long |= c.vector_id == "far";
    EXPECT_TRUE(far_long);

    for (const auto& o : a.outliers) {
        EXPECT_GE(o.distance_to_centroid, 0.0);
        EXPECT_LE(o.text_preview.size(), 203u);   // 200 characters and an ellipsis
    }
}

TEST_F(AnomalyDetectorTest, MissingSuccessRateIsNotTreatedAsZero) {
    for (auto& r : records) r.metadata.clear();
    AnomalyDetector detector({}, kDim);
    auto report = detector.detect(records);
    ASSERT_TRUE(report.ok());
    ASSERT_TRUE(report.value().analysis.has_value());
    const auto& special = report.value().analysis->special;
    EXPECT_TRUE(special.high_success_outliers.empty());
    EXPECT_TRUE(special.low_success_outliers.empty());
}

TEST_F(AnomalyDetectorTest, InputErrors) {
    AnomalyDetector detector({}, kDim);
    auto one = detector.detect({records.front()});
    ASSERT_FALSE(one.ok());
    EXPECT_EQ(one.error().code, ErrorCode::INVALID_ARGUMENT);

    auto ragged = records;
    ragged[3].vector = {1.0f, 2.0f};
    auto mismatch = detector.detect(ragged);
    ASSERT_FALSE(mismatch.ok());
    EXPECT_EQ(mismatch.error().code, ErrorCode::DIMENSION_MISMATCH);
}

TEST_F(AnomalyDetectorTest, ConfiguredDimensionIsEnforced) {
    // Every record agrees on 2 components, but the detector expects 3
    auto narrow = records;
    for (auto& r : narrow) r.vector.resize(2);
    AnomalyDetector detector({}, kDim);
    auto mismatch = detector.detect(narrow);
    ASSERT_FALSE(mismatch.ok());
    EXPECT_EQ(mismatch.error().code, ErrorCode::DIMENSION_MISMATCH);
    EXPECT_NE(mismatch.error().message.find("expected 3"), std::string::npos);

    EXPECT_THROW(AnomalyDetector(AnomalySettings{}, 0), InvalidArgumentError);
}

TEST_F(AnomalyDetectorTest, PadOrTruncateConformsVectors) {
    auto mixed = records;
    mixed[2].vector.push_back(0.0f);
    mixed[5].vector.resize(2);

    AnomalyDetector strict({}, kDim);
    EXPECT_FALSE(strict.detect(mixed).ok());

    AnomalyDetector lenient({}, kDim, vecops::DimensionPolicy::PadOrTruncate);
    auto report = lenient.detect(mixed);
    ASSERT_TRUE(report.ok()) << report.error().message;
    const auto& r = report.value();
    ASSERT_EQ(r.scores.size(), mixed.size());
    EXPECT_NE(std::find(r.outlier_indices.begin(), r.outlier_indices.end(), far_index()),
              r.outlier_indices.end());
}

TEST_F(AnomalyDetectorTest, InsightsAlwaysCarryRecommendations) {
    AnomalyDetector detector({}, kDim);
    auto report = detector.detect(records);
    ASSERT_TRUE(report.ok());
    auto insights = AnomalyDetector::insights(report.value());
    EXPECT_EQ(insights.recommendations.size(), 4u);
    EXPECT_FALSE(insights.insights.empty());
}

TEST(AnomalyMethodTest, ParseNames) {
    EXPECT_EQ(parse_anomaly_method("isolation_forest").value(), AnomalyMethod::IsolationForest);
    EXPECT_EQ(parse_anomaly_method("LOF").value(), AnomalyMethod::LocalOutlierFactor);
    EXPECT_FALSE(parse_anomaly_method("one_class_svm").ok());
}

TEST(AnomalyMathTest, PercentileInterpolates) {
    EXPECT_DOUBLE_EQ(analysis::percentile({1.0, 2.0, 3.0, 4.0, 5.0}, 50.0), 3.0);
    EXPECT_DOUBLE_EQ(analysis::percentile({0.0, 10.0}, 25.0), 2.5);
    EXPECT_DOUBLE_EQ(analysis::percentile({}, 10.0), 0.0);
}

TEST(AnomalyMathTest, AveragePathLength) {
    EXPECT_DOUBLE_EQ(analysis::average_path_length(1.0), 0.0);
    EXPECT_DOUBLE_EQ(analysis::average_path_length(2.0), 1.0);
    EXPECT_GT(analysis::average_path_length(256.0), 9.0);
}

// =============================================================================
// Service
// =============================================================================

TEST_F(AnomalyDetectorTest, ServiceStoresOneResultPerRecord) {
    InMemoryVectorStore store(3);
    for (const auto& r : records) store.insert(r);
    InMemoryClusterRepository repo;
    AnomalyDetector detector({}, kDim);
    AnomalyDetectionService service(store, repo, detector);

    auto report = service.run(AnomalyMethod::IsolationForest);
    ASSERT_TRUE(report.ok());

    auto stored = repo.list_anomaly_results("isolation_forest");
    ASSERT_EQ(stored.size(), records.size());
    size_t flagged = 0;
    for (const auto& s : stored) {
        if (s.is_anomaly) ++flagged;
        EXPECT_TRUE(s.parameters.count("contamination"));
        EXPECT_TRUE(s.parameters.count("n_estimators"));
    }
    EXPECT_EQ(flagged, report.value().outlier_indices.size());
}
