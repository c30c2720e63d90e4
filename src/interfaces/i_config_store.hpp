#pragma once

#include "../errors.hpp"
#include "../usage_snapshot.hpp"
#include <optional>
#include <string>

namespace cml {

struct AuthSession {
    std::string session_key;
    std::string organization_id;  // empty until discovered
    std::string saved_at;         // RFC3339, informational
};

class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    // Default (CurrentSession) when absent or unreadable
    [[nodiscard]] virtual DisplayMode load_display_mode() = 0;
    // Preserves the stored session
    virtual OpResult save_display_mode(DisplayMode mode) = 0;

    [[nodiscard]] virtual std::optional<AuthSession> load_session() = 0;
    // Preserves the stored display mode
    virtual OpResult save_session(const AuthSession& session) = 0;

    // Removes all persisted data
    virtual OpResult clear() = 0;
};

} // namespace cml
