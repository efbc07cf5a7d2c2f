// =============================================================================
// Clustering Tests
// =============================================================================

#include <gtest/gtest.h>
#include "counselscript/clustering/clustering_engine.hpp"
#include "counselscript/clustering/clustering_service.hpp"
#include "counselscript/clustering/hdbscan.hpp"
#include "counselscript/clustering/kmeans.hpp"
#include "counselscript/clustering/metrics.hpp"
#include "counselscript/clustering/optimal_k.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include "counselscript/thread_pool.hpp"
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace counselscript;

namespace {

// Two tight groups around (0,0,1) and (10,10,1)
std::vector<Vector> two_blobs(size_t per_blob) {
    std::vector<Vector> out;
    for (size_t i = 0; i < per_blob; ++i) {
        float d = 0.05f * static_cast<float>(i);
        out.push_back({d, 0.1f - d * 0.5f, 1.0f});
    }
    for (size_t i = 0; i < per_blob; ++i) {
        float d = 0.05f * static_cast<float>(i);
        out.push_back({10.0f + d, 10.0f - d * 0.5f, 1.0f});
    }
    return out;
}

} // namespace

class ClusteringEngineTest : public ::testing::Test {
protected:
    ClusteringEngine engine{3};

    ClusteringRequest kmeans_request(int k_min, int k_max) {
        ClusteringRequest request;
        request.algorithm = "kmeans";
        request.k_min = k_min;
        request.k_max = k_max;
        return request;
    }
};

// Five vectors, k in [2, 4]
TEST_F(ClusteringEngineTest, KMeansOnFiveVectors) {
    std::vector<Vector> vectors = {
        {1.0f, 0.0f, 0.0f}, {0.9f, 0.1f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.1f, 0.9f, 0.0f}, {0.0f, 0.0f, 1.0f},
    };
    auto result = engine.cluster(vectors, kmeans_request(2, 4));
    ASSERT_TRUE(result.ok()) << result.error().message;

    const auto& out = result.value();
    EXPECT_GE(out.cluster_count, 2);
    EXPECT_LE(out.cluster_count, 4);
    EXPECT_GE(out.silhouette_score, 0.0);
    EXPECT_LE(out.silhouette_score, 1.0);
    ASSERT_EQ(out.assignments.size(), 5u);
    EXPECT_EQ(out.centroids.size(), static_cast<size_t>(out.cluster_count));
    std::set<size_t> indices;
    for (const auto& a : out.assignments) {
        EXPECT_TRUE(indices.insert(a.vector_index).second) << "vector " << a.vector_index << " assigned twice";
        EXPECT_LT(a.vector_index, vectors.size());
        EXPECT_GE(a.cluster_label, 0);
        EXPECT_LT(a.cluster_label, out.cluster_count);
        EXPECT_GE(a.distance_to_centroid, 0.0);
    }
    EXPECT_EQ(indices.size(), vectors.size());
}

TEST_F(ClusteringEngineTest, KMeansFindsTwoBlobs) {
    auto result = engine.cluster(two_blobs(6), kmeans_request(2, 5));
    ASSERT_TRUE(result.ok());
    const auto& out = result.value();
    EXPECT_EQ(out.cluster_count, 2);
    EXPECT_GT(out.silhouette_score, 0.9);
    EXPECT_FALSE(out.performance.scores_by_k.empty());
    for (size_t i = 1; i < 6; ++i) EXPECT_EQ(out.labels[i], out.labels[0]);
    for (size_t i = 7; i < 12; ++i) EXPECT_EQ(out.labels[i], out.labels[6]);
    EXPECT_NE(out.labels[0], out.labels[6]);
}

TEST_F(ClusteringEngineTest, DeterministicForSameSeed) {
    auto a = engine.cluster(two_blobs(5), kmeans_request(2, 4));
    auto b = engine.cluster(two_blobs(5), kmeans_request(2, 4));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value().labels, b.value().labels);
    EXPECT_DOUBLE_EQ(a.value().silhouette_score, b.value().silhouette_score);
}

TEST_F(ClusteringEngineTest, FixedKWhenAutoSelectDisabled) {
    auto request = kmeans_request(3, 8);
    request.auto_select_k = false;
    auto result = engine.cluster(two_blobs(5), request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().cluster_count, 3);
    EXPECT_TRUE(result.value().performance.scores_by_k.empty());
}

TEST_F(ClusteringEngineTest, RejectsBadInput) {
    auto too_few = engine.cluster({{1.0f, 0.0f, 0.0f}}, kmeans_request(2, 4));
    ASSERT_FALSE(too_few.ok());
    EXPECT_EQ(too_few.error().code, ErrorCode::INVALID_ARGUMENT);

    auto bad_range = engine.cluster(two_blobs(3), kmeans_request(4, 2));
    ASSERT_FALSE(bad_range.ok());
    EXPECT_EQ(bad_range.error().code, ErrorCode::INVALID_ARGUMENT);

    auto bad_dim = engine.cluster({{1.0f, 0.0f}, {0.0f, 1.0f}}, kmeans_request(2, 2));
    ASSERT_FALSE(bad_dim.ok());
    EXPECT_EQ(bad_dim.error().code, ErrorCode::DIMENSION_MISMATCH);

    ClusteringRequest unknown;
    unknown.algorithm = "spectral";
    auto bad_algo = engine.cluster(two_blobs(3), unknown);
    ASSERT_FALSE(bad_algo.ok());
    EXPECT_EQ(bad_algo.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ClusteringEngineTest, PooledSearchMatchesSerial) {
    ThreadPool pool(4);
    ClusteringEngine pooled(3, vecops::DimensionPolicy::Reject, &pool);
    auto serial = engine.cluster(two_blobs(6), kmeans_request(2, 6));
    auto parallel = pooled.cluster(two_blobs(6), kmeans_request(2, 6));
    ASSERT_TRUE(serial.ok());
    ASSERT_TRUE(parallel.ok());
    EXPECT_EQ(serial.value().cluster_count, parallel.value().cluster_count);
    EXPECT_EQ(serial.value().performance.scores_by_k, parallel.value().performance.scores_by_k);
}

// Nested pool use from a pool task must not block
TEST_F(ClusteringEngineTest, PooledSearchInsidePoolTask) {
    ThreadPool pool(1);
    ClusteringEngine pooled(3, vecops::DimensionPolicy::Reject, &pool);
    auto future = pool.submit([&]() { return pooled.cluster(two_blobs(6), kmeans_request(2, 4)); });
    auto result = future.get();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().cluster_count, 2);
}

TEST_F(ClusteringEngineTest, HdbscanSeparatesBlobs) {
    ClusteringRequest request;
    request.algorithm = "hdbscan";
    request.hdbscan.min_cluster_size = 4;
    request.hdbscan.metric = clustering::DistanceMetric::Euclidean;

    auto result = engine.cluster(two_blobs(8), request);
    ASSERT_TRUE(result.ok());
    const auto& out = result.value();
    EXPECT_GE(out.cluster_count, 2);
    ASSERT_TRUE(out.performance.n_noise.has_value());

    std::set<int> first, second;
    for (size_t i = 0; i < 8; ++i) if (out.labels[i] >= 0) first.insert(out.labels[i]);
    for (size_t i = 8; i < 16; ++i) if (out.labels[i] >= 0) second.insert(out.labels[i]);
    for (int label : first) EXPECT_EQ(second.count(label), 0u);
}

TEST(ClusteringAlgorithmTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_algorithm("KMeans").value(), ClusteringAlgorithm::KMeans);
    EXPECT_EQ(parse_algorithm("hdbscan").value(), ClusteringAlgorithm::Hdbscan);
    EXPECT_FALSE(parse_algorithm("dbscan").ok());
    EXPECT_STREQ(algorithm_name(ClusteringAlgorithm::Hdbscan), "hdbscan");
}

// =============================================================================
// Metrics
// =============================================================================

TEST(ClusteringMetricsTest, SilhouetteOfSeparatedClustersIsHigh) {
    auto X = clustering::to_matrix(two_blobs(4));
    std::vector<int> labels = {0, 0, 0, 0, 1, 1, 1, 1};
    EXPECT_GT(clustering::silhouette_score(X, labels), 0.9);
}

TEST(ClusteringMetricsTest, SilhouetteSingleClusterIsZero) {
    auto X = clustering::to_matrix(two_blobs(2));
    EXPECT_DOUBLE_EQ(clustering::silhouette_score(X, {0, 0, 0, 0}), 0.0);
}

TEST(ClusteringMetricsTest, RaggedInputNamesTheFailingCall) {
    try {
        clustering::to_matrix({{1.0f, 0.0f, 0.0f}, {1.0f, 0.0f}});
        FAIL() << "ragged vectors accepted";
    } catch (const CounselScriptException& e) {
        EXPECT_EQ(e.code(), ErrorCode::DIMENSION_MISMATCH);
        EXPECT_EQ(e.context(), "to_matrix");
    }
}

TEST(ClusteringMetricsTest, NoiseIgnoredByDistinctCount) {
    EXPECT_EQ(clustering::count_distinct_labels({-1, 0, 0, 1, -1}), 2);
}

TEST(ClusteringMetricsTest, ElbowAndGapStayInRange) {
    auto X = clustering::to_matrix(two_blobs(6));
    auto elbow = clustering::elbow_method(X, 2, 6);
    EXPECT_GE(elbow.optimal_k, 2);
    EXPECT_LE(elbow.optimal_k, 6);
    EXPECT_EQ(elbow.k_values.size(), elbow.inertias.size());

    auto gap = clustering::gap_statistic(X, 2, 5, 5);
    EXPECT_GE(gap.optimal_k, 2);
    EXPECT_LE(gap.optimal_k, 5);
}

// =============================================================================
// Clustering service
// =============================================================================

class ClusteringServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto vectors = two_blobs(5);
        for (size_t i = 0; i < vectors.size(); ++i) {
            SuccessVectorRecord r;
            r.id = "v" + std::to_string(i);
            r.chunk_text = "conversation " + std::to_string(i);
            r.vector = vectors[i];
            store.insert(std::move(r));
        }
        SuccessVectorRecord failed;
        failed.id = "failed";
        failed.vector = {5.0f, 5.0f, 1.0f};
        failed.is_success = false;
        store.insert(std::move(failed));
    }

    InMemoryVectorStore store{3};
    InMemoryClusterRepository repo;
    ClusteringEngine engine{3};
};

TEST_F(ClusteringServiceTest, PersistsRunAndAssignments) {
    ClusteringService service(store, repo, engine);
    ClusteringRequest request;
    request.k_min = 2;
    request.k_max = 4;

    auto summary = service.perform_clustering(request);
    ASSERT_TRUE(summary.ok()) << summary.error().message;

    const auto& s = summary.value();
    EXPECT_EQ(s.vector_ids.size(), 10u);
    auto stored = repo.find_cluster_result(s.cluster_result_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->algorithm, "kmeans");
    EXPECT_EQ(stored->cluster_count, s.output.cluster_count);

    auto assignments = repo.list_assignments(s.cluster_result_id);
    ASSERT_EQ(assignments.size(), 10u);
    for (const auto& a : assignments) {
        EXPECT_NE(a.vector_id, "failed");
        EXPECT_TRUE(a.distance_to_centroid.has_value());
    }
}

TEST_F(ClusteringServiceTest, NoiseIsSavedWithInfiniteDistance) {
    SuccessVectorRecord stray;
    stray.id = "stray";
    stray.vector = {-50.0f, -50.0f, 1.0f};
    store.insert(std::move(stray));

    ClusteringService service(store, repo, engine);
    ClusteringRequest request;
    request.algorithm = "hdbscan";
    request.hdbscan.min_cluster_size = 4;
    request.hdbscan.metric = clustering::DistanceMetric::Euclidean;

    auto summary = service.perform_clustering(request);
    ASSERT_TRUE(summary.ok()) << summary.error().message;

    auto assignments = repo.list_assignments(summary.value().cluster_result_id);
    ASSERT_EQ(assignments.size(), 11u);
    bool stray_seen = false;
    for (const auto& a : assignments) {
        ASSERT_TRUE(a.distance_to_centroid.has_value()) << a.vector_id;
        if (a.cluster_label < 0) {
            EXPECT_TRUE(std::isinf(*a.distance_to_centroid));
            EXPECT_GT(*a.distance_to_centroid, 0.0);
        } else {
            EXPECT_TRUE(std::isfinite(*a.distance_to_centroid));
        }
        if (a.vector_id == "stray") {
            stray_seen = true;
            EXPECT_EQ(a.cluster_label, -1);
        }
    }
    EXPECT_TRUE(stray_seen);
}

TEST_F(ClusteringServiceTest, TooFewVectorsIsError) {
    ClusteringService service(store, repo, engine);
    VectorFilter filter;
    filter.counselor_names = {"nobody"};
    auto summary = service.perform_clustering(ClusteringRequest{}, filter);
    ASSERT_FALSE(summary.ok());
    EXPECT_EQ(summary.error().code, ErrorCode::INVALID_ARGUMENT);
}
