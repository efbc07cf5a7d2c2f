#include "counselscript/store/pg_cluster_repository.hpp"
#include "counselscript/db/helpers.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/ids.hpp"
#include "counselscript/util/json.hpp"

#include <cmath>
#include <sstream>

namespace counselscript {

namespace {

std::string to_param(double value) {
    // Postgres spells these Infinity / -Infinity
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    std::ostringstream ss;
    ss.precision(17);
    ss << value;
    return ss.str();
}

ClusterRepresentative read_representative(const db::Result& res, int row) {
    ClusterRepresentative rep;
    rep.cluster_result_id = res.str(row, 0);
    rep.vector_id = res.str(row, 1);
    rep.cluster_label = res.integer(row, 2);
    rep.quality_score = res.dbl(row, 3);
    rep.distance_to_centroid = res.dbl(row, 4);
    rep.is_primary = res.boolean(row, 5);
    return rep;
}

} // namespace

PgClusterRepository::PgClusterRepository(std::shared_ptr<db::ConnectionPool> pool)
    : pool_(std::move(pool)) {
    COUNSELSCRIPT_CHECK_ARGUMENT(pool_, "PgClusterRepository requires a connection pool");
}

std::string PgClusterRepository::save_cluster_run(ClusterResult result,
                                                  std::vector<ClusterAssignment> assignments) {
    if (result.id.empty()) result.id = util::generate_id();
    if (result.created_at == TimePoint{}) result.created_at = std::chrono::system_clock::now();

    db::PooledConnection conn(*pool_);
    db::Transaction tx(conn);

    db::exec(conn,
             "INSERT INTO cluster_results (id, algorithm, cluster_count, parameters, silhouette_score, created_at) "
             "VALUES ($1, $2, $3::integer, $4::jsonb, $5::double precision, to_timestamp($6::double precision))",
             {result.id, result.algorithm, std::to_string(result.cluster_count),
              util::serialize_attributes(result.parameters),
              result.silhouette_score ? to_param(*result.silhouette_score) : std::string(),
              db::to_epoch_string(result.created_at)},
             {false, false, false, false, !result.silhouette_score.has_value(), false});

    for (auto& a : assignments) {
        if (a.vector_id.empty()) {
            throw PersistenceError("Assignment without vector id", "save_cluster_run");
        }
        a.cluster_result_id = result.id;
        db::exec(conn,
                 "INSERT INTO cluster_assignments (vector_id, cluster_result_id, cluster_label, distance_to_centroid) "
                 "VALUES ($1, $2, $3::integer, $4::double precision)",
                 {a.vector_id, a.cluster_result_id, std::to_string(a.cluster_label),
                  a.distance_to_centroid ? to_param(*a.distance_to_centroid) : std::string()},
                 {false, false, false, !a.distance_to_centroid.has_value()});
    }

    tx.commit();
    LOG_INFO("Saved cluster result ", result.id, " (", result.algorithm, ", ", result.cluster_count,
             " clusters, ", assignments.size(), " assignments)");
    return result.id;
}

std::optional<ClusterResult> PgClusterRepository::find_cluster_result(const std::string& id) const {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn,
                              "SELECT id, algorithm, cluster_count, parameters::text, silhouette_score, "
                              "extract(epoch from created_at) FROM cluster_results WHERE id = $1",
                              {id});
    if (res.ntuples() == 0) return std::nullopt;

    ClusterResult result;
    result.id = res.str(0, 0);
    result.algorithm = res.str(0, 1);
    result.cluster_count = res.integer(0, 2);
    if (!res.is_null(0, 3)) result.parameters = util::parse_attributes(res.str(0, 3));
    result.silhouette_score = res.opt_dbl(0, 4);
    result.created_at = db::from_epoch_seconds(res.dbl(0, 5));
    return result;
}

std::vector<ClusterAssignment> PgClusterRepository::list_assignments(const std::string& cluster_result_id) const {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn,
                              "SELECT a.vector_id, a.cluster_result_id, a.cluster_label, a.distance_to_centroid "
                              "FROM cluster_assignments a "
                              "JOIN success_conversation_vectors v ON v.id = a.vector_id "
                              "WHERE a.cluster_result_id = $1 ORDER BY v.seq",
                              {cluster_result_id});

    std::vector<ClusterAssignment> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    for (int row = 0; row < res.ntuples(); ++row) {
        ClusterAssignment a;
        a.vector_id = res.str(row, 0);
        a.cluster_result_id = res.str(row, 1);
        a.cluster_label = res.integer(row, 2, -1);
        a.distance_to_centroid = res.opt_dbl(row, 3);
        out.push_back(std::move(a));
    }
    return out;
}

void PgClusterRepository::replace_representatives(const std::string& cluster_result_id,
                                                  const std::vector<ClusterRepresentative>& representatives) {
    db::PooledConnection conn(*pool_);
    db::Transaction tx(conn);

    db::exec(conn, "SELECT pg_advisory_xact_lock(hashtext($1))", {cluster_result_id});

    db::Result found = db::exec(conn, "SELECT 1 FROM cluster_results WHERE id = $1", {cluster_result_id});
    if (found.ntuples() == 0) {
        throw PersistenceError("Unknown cluster result: " + cluster_result_id, "replace_representatives");
    }

    db::exec(conn, "DELETE FROM cluster_representatives WHERE cluster_result_id = $1", {cluster_result_id});

    for (const auto& rep : representatives) {
        db::exec(conn,
                 "INSERT INTO cluster_representatives "
                 "(cluster_result_id, vector_id, cluster_label, quality_score, distance_to_centroid, is_primary) "
                 "VALUES ($1, $2, $3::integer, $4::double precision, $5::double precision, $6::boolean)",
                 {cluster_result_id, rep.vector_id, std::to_string(rep.cluster_label),
                  to_param(rep.quality_score), to_param(rep.distance_to_centroid),
                  rep.is_primary ? "true" : "false"});
    }

    tx.commit();
    LOG_DEBUG("Replaced representatives for ", cluster_result_id, ": ", representatives.size(), " rows");
}

std::vector<ClusterRepresentative> PgClusterRepository::list_representatives(
    const std::string& cluster_result_id) const {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn,
                              "SELECT cluster_result_id, vector_id, cluster_label, quality_score, "
                              "distance_to_centroid, is_primary FROM cluster_representatives "
                              "WHERE cluster_result_id = $1 ORDER BY id",
                              {cluster_result_id});
    std::vector<ClusterRepresentative> out;
    for (int row = 0; row < res.ntuples(); ++row) {
        out.push_back(read_representative(res, row));
    }
    return out;
}

std::vector<ClusterRepresentative> PgClusterRepository::list_primary_representatives(
    const std::string& exclude_cluster_result_id) const {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn,
                              "SELECT cluster_result_id, vector_id, cluster_label, quality_score, "
                              "distance_to_centroid, is_primary FROM cluster_representatives "
                              "WHERE is_primary AND cluster_result_id <> $1 ORDER BY id",
                              {exclude_cluster_result_id});
    std::vector<ClusterRepresentative> out;
    for (int row = 0; row < res.ntuples(); ++row) {
        out.push_back(read_representative(res, row));
    }
    return out;
}

void PgClusterRepository::save_anomaly_results(const std::vector<AnomalyResult>& results) {
    if (results.empty()) return;

    db::PooledConnection conn(*pool_);
    db::Transaction tx(conn);
    for (const auto& r : results) {
        db::exec(conn,
                 "INSERT INTO anomaly_detection_results "
                 "(vector_id, algorithm, anomaly_score, is_anomaly, parameters) "
                 "VALUES ($1, $2, $3::double precision, $4::boolean, $5::jsonb)",
                 {r.vector_id, r.algorithm, to_param(r.anomaly_score), r.is_anomaly ? "true" : "false",
                  util::serialize_attributes(r.parameters)});
    }
    tx.commit();
    LOG_INFO("Saved ", results.size(), " anomaly detection results");
}

std::vector<AnomalyResult> PgClusterRepository::list_anomaly_results(const std::string& algorithm) const {
    db::PooledConnection conn(*pool_);
    db::Result res = algorithm.empty()
        ? db::exec(conn, "SELECT vector_id, algorithm, anomaly_score, is_anomaly, parameters::text "
                         "FROM anomaly_detection_results ORDER BY id")
        : db::exec(conn, "SELECT vector_id, algorithm, anomaly_score, is_anomaly, parameters::text "
                         "FROM anomaly_detection_results WHERE algorithm = $1 ORDER BY id",
                   {algorithm});

    std::vector<AnomalyResult> out;
    for (int row = 0; row < res.ntuples(); ++row) {
        AnomalyResult r;
        r.vector_id = res.str(row, 0);
        r.algorithm = res.str(row, 1);
        r.anomaly_score = res.dbl(row, 2);
        r.is_anomaly = res.boolean(row, 3);
        if (!res.is_null(row, 4)) r.parameters = util::parse_attributes(res.str(row, 4));
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace counselscript
