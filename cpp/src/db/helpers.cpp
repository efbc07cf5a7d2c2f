#include "counselscript/db/helpers.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"

#include <cmath>
#include <cstdio>

namespace counselscript::db {

std::string to_vector_literal(const Vector& v) {
    std::string out;
    out.reserve(v.size() * 10 + 2);
    out += '[';
    char buf[32];
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ',';
        float x = std::isfinite(v[i]) ? v[i] : 0.0f;
        int n = std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(x));
        out.append(buf, static_cast<size_t>(n));
    }
    out += ']';
    return out;
}

Vector parse_vector_literal(const std::string& text) {
    Vector out;
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        return out;
    }
    const char* p = text.c_str() + 1;
    const char* end = text.c_str() + text.size() - 1;
    while (p < end) {
        char* next = nullptr;
        float x = std::strtof(p, &next);
        if (next == p) return {};
        out.push_back(x);
        p = next;
        if (p < end && *p == ',') ++p;
    }
    return out;
}

std::string to_epoch_string(TimePoint tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld.%06lld",
                  static_cast<long long>(us / 1000000), static_cast<long long>(std::llabs(us % 1000000)));
    return buf;
}

TimePoint from_epoch_seconds(double seconds) {
    auto us = static_cast<long long>(std::llround(seconds * 1e6));
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(us)));
}

Result exec(PGconn* conn, const std::string& sql, const std::vector<std::string>& params,
            const std::vector<bool>& nulls) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        bool is_null = i < nulls.size() && nulls[i];
        values.push_back(is_null ? nullptr : params[i].c_str());
    }

    Result res(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                            values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));

    if (!res.ok()) {
        std::string message = res.get() ? res.error_message() : PQerrorMessage(conn);
        LOG_ERROR("Query failed: ", message);
        throw PersistenceError("Query failed: " + message, sql.substr(0, 120));
    }
    return res;
}

} // namespace counselscript::db
