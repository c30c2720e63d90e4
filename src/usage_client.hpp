#pragma once

#include "interfaces/i_config_store.hpp"
#include "interfaces/i_usage_client.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cml {

// HTTPS client for the claude.ai usage endpoint. Each call uses its own curl
// handle; only the discovered organization ID is shared between calls.
// curl_global_init must have run before the first request.
class ClaudeUsageClient : public IUsageClient {
public:
    explicit ClaudeUsageClient(const AuthSession& session);

    FetchResult fetch_usage() override;

    // Fetch once; AuthFailure means the session key is no longer accepted
    [[nodiscard]] std::optional<FetchError> test_session();

    // Empty until discovered or loaded from the session
    [[nodiscard]] std::string organization_id() const;

    // Response decoding, exposed for tests
    static FetchResult parse_usage_response(std::string_view body, std::chrono::system_clock::time_point now);
    static std::optional<std::string> parse_organization_id(std::string_view body);
    static std::optional<std::chrono::system_clock::time_point> parse_rfc3339(std::string_view text);

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string error;  // transport failure, empty on success
    };

    HttpResponse http_get(const std::string& url) const;
    std::optional<FetchError> ensure_organization_id();

    std::string session_key_;

    mutable std::mutex org_mutex_;
    std::string organization_id_;
};

} // namespace cml
