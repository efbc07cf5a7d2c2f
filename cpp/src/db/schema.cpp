#include "counselscript/db/schema.hpp"
#include "counselscript/db/connection.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <string>

namespace counselscript::db {

void ensure_schema(PGconn* conn, int dimension) {
    if (dimension <= 0) {
        throw InvalidArgumentError("Schema dimension must be positive");
    }
    const std::string dim = std::to_string(dimension);

    Transaction tx(conn);
    exec(conn, "CREATE EXTENSION IF NOT EXISTS vector");

    exec(conn,
         "CREATE TABLE IF NOT EXISTS success_conversation_vectors ("
         "  id TEXT PRIMARY KEY,"
         "  seq BIGSERIAL,"
         "  session_id TEXT NOT NULL,"
         "  chunk_text TEXT NOT NULL,"
         "  embedding vector(" + dim + ") NOT NULL,"
         "  is_success BOOLEAN NOT NULL DEFAULT TRUE,"
         "  counselor_name TEXT NOT NULL DEFAULT '',"
         "  chunk_metadata JSONB,"
         "  chunk_index INTEGER NOT NULL DEFAULT 0,"
         "  created_at TIMESTAMPTZ NOT NULL DEFAULT now())");

    exec(conn,
         "CREATE TABLE IF NOT EXISTS cluster_results ("
         "  id TEXT PRIMARY KEY,"
         "  algorithm TEXT NOT NULL,"
         "  cluster_count INTEGER NOT NULL,"
         "  parameters JSONB,"
         "  silhouette_score DOUBLE PRECISION,"
         "  created_at TIMESTAMPTZ NOT NULL DEFAULT now())");

    exec(conn,
         "CREATE TABLE IF NOT EXISTS cluster_assignments ("
         "  vector_id TEXT NOT NULL REFERENCES success_conversation_vectors(id),"
         "  cluster_result_id TEXT NOT NULL REFERENCES cluster_results(id) ON DELETE CASCADE,"
         "  cluster_label INTEGER NOT NULL,"
         "  distance_to_centroid DOUBLE PRECISION,"
         "  PRIMARY KEY (cluster_result_id, vector_id))");

    exec(conn,
         "CREATE TABLE IF NOT EXISTS cluster_representatives ("
         "  id BIGSERIAL PRIMARY KEY,"
         "  cluster_result_id TEXT NOT NULL REFERENCES cluster_results(id) ON DELETE CASCADE,"
         "  vector_id TEXT NOT NULL REFERENCES success_conversation_vectors(id),"
         "  cluster_label INTEGER NOT NULL,"
         "  quality_score DOUBLE PRECISION NOT NULL,"
         "  distance_to_centroid DOUBLE PRECISION NOT NULL,"
         "  is_primary BOOLEAN NOT NULL DEFAULT FALSE,"
         "  created_at TIMESTAMPTZ NOT NULL DEFAULT now())");

    exec(conn,
         "CREATE TABLE IF NOT EXISTS anomaly_detection_results ("
         "  id BIGSERIAL PRIMARY KEY,"
         "  vector_id TEXT NOT NULL REFERENCES success_conversation_vectors(id),"
         "  algorithm TEXT NOT NULL,"
         "  anomaly_score DOUBLE PRECISION NOT NULL,"
         "  is_anomaly BOOLEAN NOT NULL,"
         "  parameters JSONB,"
         "  created_at TIMESTAMPTZ NOT NULL DEFAULT now())");

    exec(conn,
         "CREATE INDEX IF NOT EXISTS idx_scv_seq ON success_conversation_vectors (seq)");

    tx.commit();
    LOG_INFO("Schema ready (dimension ", dimension, ")");
}

} // namespace counselscript::db
