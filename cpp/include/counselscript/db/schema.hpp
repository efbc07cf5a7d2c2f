#pragma once

#include <libpq-fe.h>

namespace counselscript::db {

// Creates the pgvector extension and all tables if absent. Idempotent.
void ensure_schema(PGconn* conn, int dimension);

} // namespace counselscript::db
