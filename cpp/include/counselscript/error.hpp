#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace counselscript {

/**
 * Structured error reporting with context and recovery suggestions.
 * Unexpected faults are thrown; expected caller-input failures travel
 * as Outcome<T>.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_FOUND = 2,
    CONFIG_INVALID = 3,

    // Provider errors
    EMBEDDING_FAILED = 100,
    GENERATION_FAILED = 101,
    NETWORK_FAILED = 102,

    // Persistence errors
    CONNECTION_FAILED = 200,
    QUERY_FAILED = 201,
    TRANSACTION_FAILED = 202,

    // Mathematical errors
    NUMERICAL_ERROR = 300,
    DIMENSION_MISMATCH = 301,

    // Internal errors
    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class CounselScriptException : public std::runtime_error {
public:
    explicit CounselScriptException(ErrorCode code, const std::string& message,
                                    const std::string& context = "",
                                    const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "counselscript error [" + std::string(error_code_name(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

#define COUNSELSCRIPT_DEFINE_ERROR(Name, Code)                                   \
    class Name : public CounselScriptException {                                 \
    public:                                                                      \
        explicit Name(const std::string& message,                                \
                      const std::string& context = "",                           \
                      const std::string& suggestion = "")                        \
            : CounselScriptException(Code, message, context, suggestion) {}      \
    }

COUNSELSCRIPT_DEFINE_ERROR(InvalidArgumentError, ErrorCode::INVALID_ARGUMENT);
COUNSELSCRIPT_DEFINE_ERROR(ConfigError, ErrorCode::CONFIG_INVALID);
COUNSELSCRIPT_DEFINE_ERROR(EmbeddingError, ErrorCode::EMBEDDING_FAILED);
COUNSELSCRIPT_DEFINE_ERROR(GenerationError, ErrorCode::GENERATION_FAILED);
COUNSELSCRIPT_DEFINE_ERROR(NetworkError, ErrorCode::NETWORK_FAILED);
COUNSELSCRIPT_DEFINE_ERROR(PersistenceError, ErrorCode::TRANSACTION_FAILED);
COUNSELSCRIPT_DEFINE_ERROR(NumericalError, ErrorCode::NUMERICAL_ERROR);

#undef COUNSELSCRIPT_DEFINE_ERROR

// Expected failure carried by value
struct Error {
    ErrorCode code = ErrorCode::INVALID_ARGUMENT;
    std::string message;
};

template<typename T>
class Outcome {
public:
    Outcome(T value) : state_(std::move(value)) {}
    Outcome(Error error) : state_(std::move(error)) {}

    static Outcome failure(ErrorCode code, std::string message) {
        return Outcome(Error{code, std::move(message)});
    }

    bool ok() const noexcept { return std::holds_alternative<T>(state_); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& {
        throw_if_error();
        return std::get<T>(state_);
    }

    T& value() & {
        throw_if_error();
        return std::get<T>(state_);
    }

    T&& value() && {
        throw_if_error();
        return std::get<T>(std::move(state_));
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Outcome holds a value, not an error");
        }
        return std::get<Error>(state_);
    }

private:
    void throw_if_error() const {
        if (!ok()) {
            const auto& err = std::get<Error>(state_);
            throw InvalidArgumentError(err.message, error_code_name(err.code));
        }
    }

    std::variant<T, Error> state_;
};

#define COUNSELSCRIPT_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw counselscript::InvalidArgumentError(message, __func__); } while (0)

#define COUNSELSCRIPT_THROW(code, message) \
    throw counselscript::CounselScriptException(code, message, __func__)

} // namespace counselscript
