#pragma once

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <string>
#include <thread>

#include "counselscript/config.hpp"
#include "counselscript/logging.hpp"

namespace counselscript {

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

inline void default_sleep(std::chrono::milliseconds delay) {
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

// Delay before retry number `attempt` (0-based): base * multiplier^attempt
inline std::chrono::milliseconds backoff_delay(const RetrySettings& retry, int attempt) {
    double ms = retry.base_delay_ms * std::pow(retry.multiplier, attempt);
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

/**
 * Calls op until it returns without throwing or the attempts run out.
 * The last failure is wrapped by make_error and thrown.
 */
template<typename Op, typename MakeError>
auto retry_with_backoff(const RetrySettings& retry, const std::string& what,
                        Op&& op, MakeError&& make_error,
                        const SleepFunction& sleep = default_sleep) -> decltype(op()) {
    std::string last_error = "no attempt made";
    for (int attempt = 0; attempt < retry.max_attempts; ++attempt) {
        try {
            return op();
        } catch (const std::exception& e) {
            last_error = e.what();
            LOG_WARN(what, " attempt ", attempt + 1, "/", retry.max_attempts, " failed: ", last_error);
            if (attempt + 1 < retry.max_attempts) {
                sleep(backoff_delay(retry, attempt));
            }
        }
    }
    throw make_error(what + " failed after " + std::to_string(retry.max_attempts) +
                     " attempts: " + last_error);
}

} // namespace counselscript
