/**
 * @file helpers.hpp
 * @brief PostgreSQL helper functions for consistent data access
 *
 * Consolidates common patterns for:
 * - Result value extraction (with null/type handling)
 * - pgvector text literals
 * - Timestamps as epoch seconds
 * - Query execution with error handling
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

#include "counselscript/types.hpp"

namespace counselscript::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

inline bool in_range(PGresult* res, int row, int col) {
    return res && row < PQntuples(res) && col < PQnfields(res);
}

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!in_range(res, row, col) || PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!in_range(res, row, col) || PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    char* end = nullptr;
    long long parsed = std::strtoll(val, &end, 10);
    return end && *end == '\0' ? static_cast<int64_t>(parsed) : default_val;
}

inline int get_int(PGresult* res, int row, int col, int default_val = 0) {
    return static_cast<int>(get_int64(res, row, col, default_val));
}

inline std::optional<double> get_optional_double(PGresult* res, int row, int col) {
    if (!in_range(res, row, col) || PQgetisnull(res, row, col)) {
        return std::nullopt;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    double parsed = std::strtod(val, &end);
    if (!end || *end != '\0') return std::nullopt;
    return parsed;
}

inline double get_double(PGresult* res, int row, int col, double default_val = 0.0) {
    return get_optional_double(res, row, col).value_or(default_val);
}

/**
 * Safe extraction of boolean value from PGresult.
 * Handles 't'/'f', 'true'/'false', '1'/'0'.
 */
inline bool get_bool(PGresult* res, int row, int col, bool default_val = false) {
    if (!in_range(res, row, col) || PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    return val[0] == 't' || val[0] == 'T' || val[0] == '1';
}

// =============================================================================
// pgvector / timestamp conversion
// =============================================================================

// "[0.1,0.2,...]"
std::string to_vector_literal(const Vector& v);

// Parses pgvector text output; empty on malformed input
Vector parse_vector_literal(const std::string& text);

// Seconds since epoch, microsecond precision (bind with to_timestamp($n))
std::string to_epoch_string(TimePoint tp);
TimePoint from_epoch_seconds(double seconds);

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }

    bool ok() const {
        if (!res_) return false;
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    bool is_null(int row, int col) const {
        return !in_range(res_, row, col) || PQgetisnull(res_, row, col);
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int integer(int row, int col, int def = 0) const { return get_int(res_, row, col, def); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }
    double dbl(int row, int col, double def = 0.0) const { return get_double(res_, row, col, def); }
    std::optional<double> opt_dbl(int row, int col) const { return get_optional_double(res_, row, col); }
    bool boolean(int row, int col, bool def = false) const { return get_bool(res_, row, col, def); }

private:
    PGresult* res_;
};

/**
 * Execute a parameterized statement (text parameters).
 * Throws PersistenceError unless the command or query succeeded.
 * A true entry in nulls binds SQL NULL for that position.
 */
Result exec(PGconn* conn, const std::string& sql,
            const std::vector<std::string>& params = {},
            const std::vector<bool>& nulls = {});

/**
 * Get count of rows affected by last command.
 * Use after INSERT/UPDATE/DELETE.
 */
inline int cmd_tuples(PGresult* res) {
    if (!res) return 0;
    const char* val = PQcmdTuples(res);
    if (!val || *val == '\0') return 0;
    return std::atoi(val);
}

} // namespace counselscript::db
