#pragma once

#include <chrono>
#include <string>

namespace cml {

// Outcome of a marker/config file operation
struct OpResult {
    bool success = false;
    std::string error_message;

    static OpResult ok() { return {true, {}}; }
    static OpResult fail(std::string message) { return {false, std::move(message)}; }
};

enum class FetchErrorKind {
    AuthFailure,  // 401/403 from the usage endpoint
    Other
};

// Failure surfaced by the usage client
struct FetchError {
    FetchErrorKind kind = FetchErrorKind::Other;
    std::string message;
    std::chrono::steady_clock::time_point timestamp = std::chrono::steady_clock::now();

    [[nodiscard]] bool is_auth_failure() const { return kind == FetchErrorKind::AuthFailure; }
};

} // namespace cml
