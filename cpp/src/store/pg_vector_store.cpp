#include "counselscript/store/pg_vector_store.hpp"
#include "counselscript/db/helpers.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/ids.hpp"
#include "counselscript/util/json.hpp"

#include <sstream>

namespace counselscript {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, session_id, chunk_text, embedding::text, is_success, counselor_name, "
    "chunk_index, extract(epoch from created_at), chunk_metadata::text "
    "FROM success_conversation_vectors";

// Postgres text[] literal with every element quoted
std::string to_text_array(const std::vector<std::string>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ',';
        out += '"';
        for (char c : items[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

SuccessVectorRecord read_record(const db::Result& res, int row) {
    SuccessVectorRecord record;
    record.id = res.str(row, 0);
    record.session_id = res.str(row, 1);
    record.chunk_text = res.str(row, 2);
    record.vector = db::parse_vector_literal(res.str(row, 3));
    record.is_success = res.boolean(row, 4, true);
    record.counselor_name = res.str(row, 5);
    record.chunk_index = res.integer(row, 6);
    record.created_at = db::from_epoch_seconds(res.dbl(row, 7));
    if (!res.is_null(row, 8)) {
        record.metadata = util::parse_attributes(res.str(row, 8));
    }
    return record;
}

// Appends the WHERE clause for filter, numbering parameters after params.size()
std::string where_clause(const VectorFilter& filter, std::vector<std::string>& params) {
    std::vector<std::string> conditions;
    auto next = [&params](std::string value) {
        params.push_back(std::move(value));
        return "$" + std::to_string(params.size());
    };

    if (filter.is_success) {
        conditions.push_back("is_success = " + next(*filter.is_success ? "true" : "false") + "::boolean");
    }
    if (filter.created_from) {
        conditions.push_back("created_at >= to_timestamp(" + next(db::to_epoch_string(*filter.created_from)) +
                             "::double precision)");
    }
    if (filter.created_to) {
        conditions.push_back("created_at <= to_timestamp(" + next(db::to_epoch_string(*filter.created_to)) +
                             "::double precision)");
    }
    if (!filter.counselor_names.empty()) {
        conditions.push_back("counselor_name = ANY(" + next(to_text_array(filter.counselor_names)) + "::text[])");
    }
    if (filter.min_success_rate) {
        std::ostringstream ss;
        ss.precision(17);
        ss << *filter.min_success_rate;
        conditions.push_back("(chunk_metadata->>'success_rate')::double precision >= " + next(ss.str()) +
                             "::double precision");
    }

    if (conditions.empty()) return "";
    std::string sql = " WHERE ";
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i) sql += " AND ";
        sql += conditions[i];
    }
    return sql;
}

} // namespace

PgVectorStore::PgVectorStore(std::shared_ptr<db::ConnectionPool> pool, size_t dimension,
                             vecops::DimensionPolicy policy)
    : pool_(std::move(pool)), dimension_(dimension), policy_(policy) {
    COUNSELSCRIPT_CHECK_ARGUMENT(pool_, "PgVectorStore requires a connection pool");
    if (dimension_ == 0) {
        throw InvalidArgumentError("Vector dimension must be positive");
    }
}

std::string PgVectorStore::insert(SuccessVectorRecord record) {
    if (!vecops::conform_dimension(record.vector, dimension_, policy_)) {
        throw InvalidArgumentError("Vector has " + std::to_string(record.vector.size()) +
                                   " components, store expects " + std::to_string(dimension_));
    }
    if (record.id.empty()) record.id = util::generate_id();
    if (record.created_at == TimePoint{}) record.created_at = std::chrono::system_clock::now();

    db::PooledConnection conn(*pool_);
    db::exec(conn,
             "INSERT INTO success_conversation_vectors "
             "(id, session_id, chunk_text, embedding, is_success, counselor_name, chunk_index, "
             " created_at, chunk_metadata) "
             "VALUES ($1, $2, $3, $4::vector, $5::boolean, $6, $7::integer, "
             " to_timestamp($8::double precision), $9::jsonb)",
             {record.id, record.session_id, record.chunk_text, db::to_vector_literal(record.vector),
              record.is_success ? "true" : "false", record.counselor_name,
              std::to_string(record.chunk_index), db::to_epoch_string(record.created_at),
              util::serialize_attributes(record.metadata)});

    LOG_DEBUG("Inserted vector ", record.id, " (session ", record.session_id, ")");
    return record.id;
}

std::optional<SuccessVectorRecord> PgVectorStore::get_vector(const std::string& id) const {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn, std::string(kSelectColumns) + " WHERE id = $1", {id});
    if (res.ntuples() == 0) return std::nullopt;
    return read_record(res, 0);
}

std::vector<SuccessVectorRecord> PgVectorStore::get_success_vectors(const VectorFilter& filter) const {
    std::vector<std::string> params;
    std::string sql = std::string(kSelectColumns) + where_clause(filter, params) + " ORDER BY seq";

    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn, sql, params);

    std::vector<SuccessVectorRecord> out;
    out.reserve(static_cast<size_t>(res.ntuples()));
    for (int row = 0; row < res.ntuples(); ++row) {
        out.push_back(read_record(res, row));
    }
    return out;
}

std::vector<ScoredRecord> PgVectorStore::nearest_neighbors(const Vector& query,
                                                           size_t top_k,
                                                           double similarity_threshold,
                                                           const VectorFilter& filter) const {
    Vector q = query;
    if (!vecops::conform_dimension(q, dimension_, policy_)) {
        throw InvalidArgumentError("Query has " + std::to_string(query.size()) +
                                   " components, store expects " + std::to_string(dimension_));
    }
    if (top_k == 0) return {};

    std::vector<std::string> params{db::to_vector_literal(q)};
    std::string where = where_clause(filter, params);

    std::ostringstream threshold;
    threshold.precision(17);
    threshold << similarity_threshold;
    params.push_back(threshold.str());
    const std::string threshold_param = "$" + std::to_string(params.size());
    params.push_back(std::to_string(top_k));
    const std::string limit_param = "$" + std::to_string(params.size());

    std::string sql =
        "SELECT * FROM ("
        "  SELECT id, session_id, chunk_text, embedding::text, is_success, counselor_name, "
        "  chunk_index, extract(epoch from created_at), chunk_metadata::text, "
        "  1 - (embedding <=> $1::vector) AS similarity, seq "
        "  FROM success_conversation_vectors" + where +
        ") scored WHERE similarity >= " + threshold_param + "::double precision "
        "ORDER BY similarity DESC, seq ASC LIMIT " + limit_param + "::integer";

    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn, sql, params);

    std::vector<ScoredRecord> results;
    results.reserve(static_cast<size_t>(res.ntuples()));
    for (int row = 0; row < res.ntuples(); ++row) {
        results.push_back({read_record(res, row), res.dbl(row, 9)});
    }
    LOG_DEBUG("Nearest neighbours (pgvector): ", results.size(), " above ", similarity_threshold);
    return results;
}

bool PgVectorStore::enrich_metadata(const std::string& id, const Attributes& extra) {
    db::PooledConnection conn(*pool_);
    db::Result res = db::exec(conn,
                              "UPDATE success_conversation_vectors "
                              "SET chunk_metadata = COALESCE(chunk_metadata, '{}'::jsonb) || $2::jsonb "
                              "WHERE id = $1",
                              {id, util::serialize_attributes(extra)});
    return db::cmd_tuples(res.get()) > 0;
}

} // namespace counselscript
