#include "config_store.hpp"
#include <spdlog/spdlog.h>
#include <ctime>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace cml {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kSessionKey = "sessionKey";
constexpr const char* kOrganizationId = "organizationId";
constexpr const char* kSavedAt = "savedAt";
constexpr const char* kMenuBarIndicator = "menuBarIndicator";

std::string string_field(const json& doc, const char* key) {
    if (const auto it = doc.find(key); it != doc.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

std::string utc_now_rfc3339() {
    const auto now = std::time(nullptr);
    std::tm tm_val{};
    gmtime_r(&now, &tm_val);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z", tm_val.tm_year + 1900, tm_val.tm_mon + 1,
                       tm_val.tm_mday, tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
}

} // namespace

JsonConfigStore::JsonConfigStore(fs::path path)
    : path_(std::move(path))
{
}

json JsonConfigStore::read_document() const {
    std::ifstream file(path_);
    if (!file) {
        return json::object();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::warn("[config] {} is not valid JSON, using defaults", path_.string());
        return json::object();
    }
    return doc;
}

OpResult JsonConfigStore::write_document(const json& doc) const {
    fs::path tmp = path_;
    tmp += fmt::format(".tmp.{}", getpid());

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            return OpResult::fail(fmt::format("cannot write {}", tmp.string()));
        }
        // Restrict before the session key is written
        std::error_code perm_ec;
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, perm_ec);
        if (perm_ec) {
            spdlog::warn("[config] cannot restrict permissions of {}: {}", tmp.string(), perm_ec.message());
        }

        file << doc.dump(2) << '\n';
        file.flush();
        if (!file) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return OpResult::fail(fmt::format("failed writing {}", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return OpResult::fail(fmt::format("cannot replace {}: {}", path_.string(), ec.message()));
    }
    return OpResult::ok();
}

DisplayMode JsonConfigStore::load_display_mode() {
    std::lock_guard lock(mutex_);
    const auto doc = read_document();
    return parse_display_mode(string_field(doc, kMenuBarIndicator)).value_or(DisplayMode::CurrentSession);
}

OpResult JsonConfigStore::save_display_mode(const DisplayMode mode) {
    std::lock_guard lock(mutex_);
    auto doc = read_document();
    doc[kMenuBarIndicator] = std::string(display_mode_key(mode));
    return write_document(doc);
}

std::optional<AuthSession> JsonConfigStore::load_session() {
    std::lock_guard lock(mutex_);
    const auto doc = read_document();

    AuthSession session;
    session.session_key = string_field(doc, kSessionKey);
    if (session.session_key.empty()) {
        return std::nullopt;
    }
    session.organization_id = string_field(doc, kOrganizationId);
    session.saved_at = string_field(doc, kSavedAt);
    return session;
}

OpResult JsonConfigStore::save_session(const AuthSession& session) {
    std::lock_guard lock(mutex_);
    auto doc = read_document();

    doc[kSessionKey] = session.session_key;
    if (session.organization_id.empty()) {
        doc.erase(kOrganizationId);
    } else {
        doc[kOrganizationId] = session.organization_id;
    }
    doc[kSavedAt] = session.saved_at.empty() ? utc_now_rfc3339() : session.saved_at;
    if (!doc.contains(kMenuBarIndicator)) {
        doc[kMenuBarIndicator] = std::string(display_mode_key(DisplayMode::CurrentSession));
    }
    return write_document(doc);
}

OpResult JsonConfigStore::clear() {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return OpResult::fail(fmt::format("cannot remove {}: {}", path_.string(), ec.message()));
    }
    return OpResult::ok();
}

} // namespace cml
