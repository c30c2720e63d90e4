#pragma once

#include "interfaces/i_config_store.hpp"
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>

namespace cml {

// Config file shared by the CLI and the background instance:
//   { "sessionKey", "organizationId", "savedAt", "menuBarIndicator" }
// Each save rewrites only its own keys and keeps everything else.
class JsonConfigStore : public IConfigStore {
public:
    explicit JsonConfigStore(std::filesystem::path path);

    [[nodiscard]] DisplayMode load_display_mode() override;
    OpResult save_display_mode(DisplayMode mode) override;

    [[nodiscard]] std::optional<AuthSession> load_session() override;
    OpResult save_session(const AuthSession& session) override;

    OpResult clear() override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    // Empty object when the file is missing or not valid JSON
    nlohmann::json read_document() const;
    OpResult write_document(const nlohmann::json& doc) const;

    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace cml
