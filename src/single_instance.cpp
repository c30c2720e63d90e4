#include "single_instance.hpp"

#include <spdlog/spdlog.h>
#include <cassert>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace cml {

SingleInstance::SingleInstance(fs::path marker_path, IProcessControl* process_control)
    : marker_path_(std::move(marker_path))
    , process_control_(process_control) {
    assert(process_control_ && "IProcessControl must not be null");
}

std::optional<int> SingleInstance::parse_pid(std::string_view text) {
    // Tolerate surrounding whitespace (e.g. a trailing newline written by hand)
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    int pid = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc{} || ptr != text.data() + text.size() || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

std::optional<int> SingleInstance::active_pid() const {
    std::ifstream file(marker_path_);
    if (!file) return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_pid(buffer.str());
}

bool SingleInstance::is_active() {
    std::error_code ec;
    if (!fs::exists(marker_path_, ec)) {
        return false;
    }

    const auto pid = active_pid();
    if (!pid) {
        remove_stale_marker("unparsable PID");
        return false;
    }

    if (!process_control_->is_alive(*pid)) {
        remove_stale_marker("process " + std::to_string(*pid) + " is gone");
        return false;
    }

    return true;
}

OpResult SingleInstance::claim() {
    std::ofstream file(marker_path_, std::ios::out | std::ios::trunc);
    if (!file) {
        return OpResult::fail("cannot open " + marker_path_.string() + ": " + strerror(errno));
    }

    file << process_control_->current_pid();
    file.flush();
    if (!file) {
        return OpResult::fail("cannot write " + marker_path_.string());
    }

    std::error_code ec;
    fs::permissions(marker_path_,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[instance] cannot set permissions on {}: {}", marker_path_.string(), ec.message());
    }

    spdlog::debug("[instance] claimed {} for PID {}", marker_path_.string(), process_control_->current_pid());
    return OpResult::ok();
}

OpResult SingleInstance::release() {
    std::error_code ec;
    fs::remove(marker_path_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return OpResult::fail("cannot remove " + marker_path_.string() + ": " + ec.message());
    }
    return OpResult::ok();
}

void SingleInstance::remove_stale_marker(std::string_view reason) {
    spdlog::info("[instance] removing stale marker {} ({})", marker_path_.string(), reason);
    if (const auto result = release(); !result.success) {
        spdlog::warn("[instance] {}", result.error_message);
    }
}

} // namespace cml
