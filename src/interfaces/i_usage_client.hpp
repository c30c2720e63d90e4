#pragma once

#include "../errors.hpp"
#include "../usage_snapshot.hpp"
#include <memory>
#include <optional>

namespace cml {

struct FetchResult {
    std::shared_ptr<const UsageSnapshot> snapshot;
    std::optional<FetchError> error;

    [[nodiscard]] bool ok() const { return snapshot != nullptr && !error; }

    static FetchResult success(std::shared_ptr<const UsageSnapshot> s) { return {std::move(s), std::nullopt}; }
    static FetchResult failure(FetchErrorKind kind, std::string message) {
        return {nullptr, FetchError{kind, std::move(message)}};
    }
};

// Remote usage-data source. Must be safe to call concurrently with itself
// and must bound its own latency.
class IUsageClient {
public:
    virtual ~IUsageClient() = default;

    virtual FetchResult fetch_usage() = 0;
};

} // namespace cml
