// =============================================================================
// PostgreSQL Backend Tests
// =============================================================================
//
// Connects with the CS_DB_* environment variables and skips when no server
// is reachable. Rows are tagged with a per-test counselor name and removed
// in TearDown.

#include <gtest/gtest.h>
#include "counselscript/config.hpp"
#include "counselscript/db/connection.hpp"
#include "counselscript/db/schema.hpp"
#include "counselscript/store/pg_cluster_repository.hpp"
#include "counselscript/store/pg_vector_store.hpp"
#include "counselscript/util/ids.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace counselscript;

class PgBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = load_config();
        dimension = static_cast<size_t>(config.embedding.dimension);

        db::Connection check(config.database_conninfo());
        if (!check.ok()) {
            GTEST_SKIP() << "Database connection failed: " << check.error();
        }
        db::ensure_schema(check.get(), config.embedding.dimension);

        pool = std::make_shared<db::ConnectionPool>(config);
        store = std::make_unique<PgVectorStore>(pool, dimension);
        repo = std::make_unique<PgClusterRepository>(pool);
        counselor = "test-" + util::generate_id();
    }

    void TearDown() override {
        if (!pool) return;
        db::PooledConnection conn(*pool);
        for (const auto& run : runs) {
            db::exec(conn, "DELETE FROM cluster_results WHERE id = $1", {run});
        }
        const std::string owned = "SELECT id FROM success_conversation_vectors WHERE counselor_name = $1";
        db::exec(conn, "DELETE FROM anomaly_detection_results WHERE vector_id IN (" + owned + ")", {counselor});
        db::exec(conn, "DELETE FROM success_conversation_vectors WHERE counselor_name = $1", {counselor});
    }

    // Unit vector at cosine similarity s to the first axis
    Vector at_similarity(double s) const {
        Vector v(dimension, 0.0f);
        v[0] = static_cast<float>(s);
        v[1] = static_cast<float>(std::sqrt(1.0 - s * s));
        return v;
    }

    std::string add(double similarity, bool success = true) {
        SuccessVectorRecord r;
        r.session_id = "session-" + util::generate_id();
        r.chunk_text = "chunk at " + std::to_string(similarity);
        r.vector = at_similarity(similarity);
        r.is_success = success;
        r.counselor_name = counselor;
        r.metadata["success_rate"] = similarity;
        return store->insert(std::move(r));
    }

    VectorFilter own_rows() const {
        VectorFilter filter;
        filter.counselor_names = {counselor};
        return filter;
    }

    Config config;
    size_t dimension = 0;
    std::shared_ptr<db::ConnectionPool> pool;
    std::unique_ptr<PgVectorStore> store;
    std::unique_ptr<PgClusterRepository> repo;
    std::string counselor;
    std::vector<std::string> runs;
};

TEST_F(PgBackendTest, InsertAndFetchVector) {
    auto id = add(0.9);
    auto stored = store->get_vector(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->counselor_name, counselor);
    ASSERT_EQ(stored->vector.size(), dimension);
    EXPECT_NEAR(stored->vector[0], 0.9f, 1e-5);
    EXPECT_FALSE(store->get_vector("no-such-id").has_value());
}

TEST_F(PgBackendTest, NearestNeighborsMatchInMemoryOrdering) {
    auto best = add(0.95);
    auto good = add(0.80);
    add(0.40);
    add(0.99, false);

    auto hits = store->nearest_neighbors(at_similarity(1.0), 5, 0.7, own_rows());
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].record.id, best);
    EXPECT_EQ(hits[1].record.id, good);
    EXPECT_NEAR(hits[0].similarity_score, 0.95, 1e-4);

    EXPECT_TRUE(store->nearest_neighbors(at_similarity(1.0), 1, 0.96, own_rows()).empty());
}

TEST_F(PgBackendTest, FilterAndMetadata) {
    add(0.9);
    auto low = add(0.5);
    auto filter = own_rows();
    filter.min_success_rate = 0.8;
    EXPECT_EQ(store->get_success_vectors(filter).size(), 1u);

    ASSERT_TRUE(store->enrich_metadata(low, {{"success_rate", 0.85}}));
    EXPECT_EQ(store->get_success_vectors(filter).size(), 2u);
    EXPECT_FALSE(store->enrich_metadata("no-such-id", {{"k", std::string("v")}}));
}

TEST_F(PgBackendTest, ClusterRunRoundTrip) {
    auto a = add(0.9);
    auto b = add(0.7);

    ClusterResult result;
    result.algorithm = "kmeans";
    result.cluster_count = 2;
    result.silhouette_score = 0.42;
    auto run = repo->save_cluster_run(result, {{a, "", 0, 0.1}, {b, "", 1, std::nullopt}});
    runs.push_back(run);

    auto found = repo->find_cluster_result(run);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->algorithm, "kmeans");
    EXPECT_EQ(found->cluster_count, 2);

    auto assignments = repo->list_assignments(run);
    ASSERT_EQ(assignments.size(), 2u);
    for (const auto& assignment : assignments) {
        if (assignment.vector_id == b) EXPECT_FALSE(assignment.distance_to_centroid.has_value());
    }
    EXPECT_FALSE(repo->find_cluster_result("no-such-run").has_value());
}

TEST_F(PgBackendTest, NoiseDistanceRoundTripsAsInfinity) {
    auto a = add(0.9);
    auto b = add(0.7);
    auto run = repo->save_cluster_run(ClusterResult{},
                                      {{a, "", 0, 0.1}, {b, "", -1, std::numeric_limits<double>::infinity()}});
    runs.push_back(run);

    auto assignments = repo->list_assignments(run);
    ASSERT_EQ(assignments.size(), 2u);
    for (const auto& assignment : assignments) {
        ASSERT_TRUE(assignment.distance_to_centroid.has_value());
        if (assignment.vector_id == b) {
            EXPECT_TRUE(std::isinf(*assignment.distance_to_centroid));
            EXPECT_GT(*assignment.distance_to_centroid, 0.0);
        }
    }
}

TEST_F(PgBackendTest, RepresentativeReplacementIsWholesale) {
    auto a = add(0.9);
    auto b = add(0.7);
    auto run = repo->save_cluster_run(ClusterResult{}, {{a, "", 0, 0.1}, {b, "", 0, 0.2}});
    runs.push_back(run);

    repo->replace_representatives(run, {{run, a, 0, 0.9, 0.1, true}, {run, b, 0, 0.6, 0.2, false}});
    repo->replace_representatives(run, {{run, b, 0, 0.8, 0.2, true}});

    auto reps = repo->list_representatives(run);
    ASSERT_EQ(reps.size(), 1u);
    EXPECT_EQ(reps[0].vector_id, b);
    EXPECT_TRUE(reps[0].is_primary);

    for (const auto& primary : repo->list_primary_representatives(run)) {
        EXPECT_NE(primary.cluster_result_id, run);
    }
}

TEST_F(PgBackendTest, AnomalyResultsFilterByAlgorithm) {
    auto a = add(0.9);
    repo->save_anomaly_results({{a, "isolation_forest", -0.3, true, {{"contamination", 0.1}}},
                                {a, "lof", -1.1, false, {}}});

    bool found = false;
    for (const auto& r : repo->list_anomaly_results("lof")) {
        EXPECT_EQ(r.algorithm, "lof");
        found |= r.vector_id == a;
    }
    EXPECT_TRUE(found);
}
