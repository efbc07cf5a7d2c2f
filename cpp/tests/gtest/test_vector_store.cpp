// =============================================================================
// Vector Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "counselscript/error.hpp"
#include "counselscript/store/cached_vector_search.hpp"
#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/store/vector_store.hpp"
#include <chrono>
#include <cmath>
#include <memory>
#include <string>

using namespace counselscript;

namespace {

SuccessVectorRecord make_record(const std::string& id, Vector v, bool success = true,
                                const std::string& counselor = "tanaka") {
    SuccessVectorRecord r;
    r.id = id;
    r.session_id = "session-" + id;
    r.chunk_text = "text " + id;
    r.vector = std::move(v);
    r.is_success = success;
    r.counselor_name = counselor;
    return r;
}

// Unit vector at cosine similarity s to (1, 0, 0)
Vector at_similarity(double s) {
    return {static_cast<float>(s), static_cast<float>(std::sqrt(1.0 - s * s)), 0.0f};
}

} // namespace

class VectorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<InMemoryVectorStore>(3);
        store->insert(make_record("a", at_similarity(0.95)));
        store->insert(make_record("b", at_similarity(0.80)));
        store->insert(make_record("c", at_similarity(0.60), true, "suzuki"));
        store->insert(make_record("f", at_similarity(0.99), false));
    }

    std::shared_ptr<InMemoryVectorStore> store;
    const Vector query{1.0f, 0.0f, 0.0f};
};

TEST_F(VectorStoreTest, NearestNeighborsOrderedBySimilarity) {
    auto hits = store->nearest_neighbors(query, 5, 0.5, VectorFilter{});
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].record.id, "a");
    EXPECT_EQ(hits[1].record.id, "b");
    EXPECT_EQ(hits[2].record.id, "c");
    EXPECT_NEAR(hits[0].similarity_score, 0.95, 1e-5);
}

// Equal similarities come back in insertion order
TEST_F(VectorStoreTest, TiesKeepInsertionOrder) {
    store->insert(make_record("z", at_similarity(0.90)));
    store->insert(make_record("m", at_similarity(0.90)));
    store->insert(make_record("y", at_similarity(0.90)));

    auto hits = store->nearest_neighbors(query, 4, 0.85, VectorFilter{});
    ASSERT_EQ(hits.size(), 4u);
    EXPECT_EQ(hits[0].record.id, "a");
    EXPECT_EQ(hits[1].record.id, "z");
    EXPECT_EQ(hits[2].record.id, "m");
    EXPECT_EQ(hits[3].record.id, "y");

    auto top_two = store->nearest_neighbors(query, 2, 0.85, VectorFilter{});
    ASSERT_EQ(top_two.size(), 2u);
    EXPECT_EQ(top_two[1].record.id, "z");
}

TEST_F(VectorStoreTest, TopOneAboveThreshold) {
    auto hits = store->nearest_neighbors(query, 1, 0.7, VectorFilter{});
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].record.id, "a");
}

TEST_F(VectorStoreTest, ThresholdAboveBestMatchReturnsNothing) {
    EXPECT_TRUE(store->nearest_neighbors(query, 1, 0.96, VectorFilter{}).empty());
}

// Default filter excludes failed conversations even when they are closer
TEST_F(VectorStoreTest, DefaultFilterSelectsSuccessesOnly) {
    EXPECT_EQ(store->get_success_vectors(VectorFilter{}).size(), 3u);
    EXPECT_EQ(store->get_success_vectors(VectorFilter::any()).size(), 4u);

    auto any = store->nearest_neighbors(query, 1, 0.0, VectorFilter::any());
    ASSERT_EQ(any.size(), 1u);
    EXPECT_EQ(any[0].record.id, "f");
}

TEST_F(VectorStoreTest, CounselorFilter) {
    VectorFilter filter;
    filter.counselor_names = {"suzuki"};
    auto records = store->get_success_vectors(filter);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "c");
}

TEST_F(VectorStoreTest, MinSuccessRateUsesMetadata) {
    ASSERT_TRUE(store->enrich_metadata("b", {{"success_rate", 0.9}}));
    VectorFilter filter;
    filter.min_success_rate = 0.8;
    auto records = store->get_success_vectors(filter);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "b");
}

TEST_F(VectorStoreTest, EnrichUnknownIdReturnsFalse) {
    EXPECT_FALSE(store->enrich_metadata("missing", {{"k", std::string("v")}}));
}

TEST_F(VectorStoreTest, WrongDimensionRejected) {
    EXPECT_THROW(store->insert(make_record("x", {1.0f, 2.0f})), InvalidArgumentError);
    EXPECT_THROW(store->nearest_neighbors({1.0f}, 1, 0.0, VectorFilter{}), InvalidArgumentError);
}

TEST_F(VectorStoreTest, PadPolicyConformsVectors) {
    InMemoryVectorStore padded(3, vecops::DimensionPolicy::PadOrTruncate);
    auto id = padded.insert(make_record("", {1.0f}));
    auto stored = padded.get_vector(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->vector, (Vector{1.0f, 0.0f, 0.0f}));
}

TEST_F(VectorStoreTest, DuplicateIdRejected) {
    EXPECT_THROW(store->insert(make_record("a", at_similarity(0.5))), InvalidArgumentError);
}

// =============================================================================
// Cached search
// =============================================================================

class CachedVectorSearchTest : public VectorStoreTest {
protected:
    std::chrono::steady_clock::time_point now{};
    CachedVectorSearch::ClockFunction clock = [this]() { return now; };
};

TEST_F(CachedVectorSearchTest, RepeatQueriesHitCache) {
    CachedVectorSearch cached(store, std::chrono::seconds(60), 16, clock);

    auto first = cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});
    auto second = cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});

    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(first[0].record.id, second[0].record.id);
    EXPECT_EQ(cached.stats().hits, 1u);
    EXPECT_EQ(cached.stats().misses, 1u);
}

TEST_F(CachedVectorSearchTest, DifferentParametersMiss) {
    CachedVectorSearch cached(store, std::chrono::seconds(60), 16, clock);
    cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});
    cached.nearest_neighbors(query, 3, 0.5, VectorFilter{});
    cached.nearest_neighbors(query, 2, 0.6, VectorFilter{});
    EXPECT_EQ(cached.stats().misses, 3u);
}

TEST_F(CachedVectorSearchTest, EntriesExpireAfterTtl) {
    CachedVectorSearch cached(store, std::chrono::seconds(60), 16, clock);
    cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});
    now += std::chrono::seconds(61);
    cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});
    EXPECT_EQ(cached.stats().misses, 2u);
    EXPECT_EQ(cached.stats().hits, 0u);
}

TEST_F(CachedVectorSearchTest, CapacityEvictsOldest) {
    CachedVectorSearch cached(store, std::chrono::seconds(60), 1, clock);
    cached.nearest_neighbors(query, 1, 0.5, VectorFilter{});
    cached.nearest_neighbors(query, 2, 0.5, VectorFilter{});
    EXPECT_EQ(cached.stats().entries, 1u);
    EXPECT_GE(cached.stats().evictions, 1u);
}

TEST_F(CachedVectorSearchTest, BatchReturnsOneListPerQuery) {
    CachedVectorSearch cached(store, std::chrono::seconds(60), 16, clock);
    auto results = cached.batch_nearest_neighbors({query, Vector{0.0f, 1.0f, 0.0f}}, 1, 0.0, VectorFilter{});
    ASSERT_EQ(results.size(), 2u);
    ASSERT_EQ(results[0].size(), 1u);
    EXPECT_EQ(results[0][0].record.id, "a");
    ASSERT_EQ(results[1].size(), 1u);
    EXPECT_EQ(results[1][0].record.id, "c");
}

// =============================================================================
// Cluster repository
// =============================================================================

class ClusterRepositoryTest : public ::testing::Test {
protected:
    InMemoryClusterRepository repo;
};

TEST_F(ClusterRepositoryTest, SaveAndFindRun) {
    ClusterResult result;
    result.algorithm = "kmeans";
    result.cluster_count = 2;
    auto id = repo.save_cluster_run(result, {{"v1", "", 0, 0.1}, {"v2", "", 1, std::nullopt}});

    auto found = repo.find_cluster_result(id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->cluster_count, 2);
    auto assignments = repo.list_assignments(id);
    ASSERT_EQ(assignments.size(), 2u);
    EXPECT_EQ(assignments[0].cluster_result_id, id);
    EXPECT_FALSE(assignments[1].distance_to_centroid.has_value());
}

TEST_F(ClusterRepositoryTest, ReplaceRepresentativesIsWholesale) {
    auto id = repo.save_cluster_run(ClusterResult{}, {});
    repo.replace_representatives(id, {{id, "v1", 0, 0.9, 0.1, true}, {id, "v2", 0, 0.7, 0.2, false}});
    repo.replace_representatives(id, {{id, "v3", 1, 0.8, 0.1, true}});

    auto reps = repo.list_representatives(id);
    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0].vector_id, "v3");
}

TEST_F(ClusterRepositoryTest, PrimariesExcludeGivenRun) {
    auto a = repo.save_cluster_run(ClusterResult{}, {});
    auto b = repo.save_cluster_run(ClusterResult{}, {});
    repo.replace_representatives(a, {{a, "va", 0, 0.9, 0.1, true}});
    repo.replace_representatives(b, {{b, "vb", 0, 0.9, 0.1, true}, {b, "vc", 0, 0.6, 0.1, false}});

    auto primaries = repo.list_primary_representatives(a);
    ASSERT_EQ(primaries.size(), 1u);
    EXPECT_EQ(primaries[0].vector_id, "vb");
}

TEST_F(ClusterRepositoryTest, AnomalyResultsFilterByAlgorithm) {
    repo.save_anomaly_results({{"v1", "isolation_forest", -0.6, true, {}},
                               {"v2", "lof", -1.2, false, {}}});
    EXPECT_EQ(repo.list_anomaly_results().size(), 2u);
    ASSERT_EQ(repo.list_anomaly_results("lof").size(), 1u);
    EXPECT_EQ(repo.list_anomaly_results("lof")[0].vector_id, "v2");
}
