#include "counselscript/error.hpp"

namespace counselscript {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::CONFIG_INVALID: return "config_invalid";
        case ErrorCode::EMBEDDING_FAILED: return "embedding_failed";
        case ErrorCode::GENERATION_FAILED: return "generation_failed";
        case ErrorCode::NETWORK_FAILED: return "network_failed";
        case ErrorCode::CONNECTION_FAILED: return "connection_failed";
        case ErrorCode::QUERY_FAILED: return "query_failed";
        case ErrorCode::TRANSACTION_FAILED: return "transaction_failed";
        case ErrorCode::NUMERICAL_ERROR: return "numerical_error";
        case ErrorCode::DIMENSION_MISMATCH: return "dimension_mismatch";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

} // namespace counselscript
