#include "auth.hpp"
#include "usage_client.hpp"
#include "usage_format.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <spawn.h>
#include <vector>

extern char** environ;

namespace cml {

namespace {

constexpr const char* kLoginUrl = "https://claude.ai";

} // namespace

std::string clean_session_key(std::string_view raw) {
    auto is_trimmed = [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
    };
    while (!raw.empty() && is_trimmed(raw.front())) raw.remove_prefix(1);
    while (!raw.empty() && is_trimmed(raw.back())) raw.remove_suffix(1);
    return std::string(raw);
}

OpResult open_browser(const std::string& url) {
    std::vector<char*> argv = {const_cast<char*>("xdg-open"), const_cast<char*>(url.c_str()), nullptr};

    pid_t pid = -1;
    if (const int rc = posix_spawnp(&pid, "xdg-open", nullptr, nullptr, argv.data(), environ); rc != 0) {
        return OpResult::fail(std::string("failed to open browser: ") + strerror(rc));
    }
    spdlog::debug("[auth] xdg-open started with PID {}", pid);
    return OpResult::ok();
}

std::optional<AuthSession> prompt_for_session(IConfigStore& store, std::istream& in, std::ostream& out,
                                              std::ostream& err) {
    out << "╔════════════════════════════════════════════════════════════╗\n";
    out << "║           Claude Monitor Lite - Authentication            ║\n";
    out << "╚════════════════════════════════════════════════════════════╝\n\n";
    out << "Press Enter to open browser..." << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        err << "Login cancelled." << std::endl;
        return std::nullopt;
    }

    if (const auto opened = open_browser(kLoginUrl); !opened.success) {
        // Not fatal: the user can open the page by hand
        spdlog::warn("[auth] {}", opened.error_message);
        out << "\nCould not open a browser (" << opened.error_message << "). Visit " << kLoginUrl
            << " manually.\n";
    } else {
        out << "\nBrowser opened. ";
    }

    out << "Please follow these steps:\n\n";
    out << "  1. Login to Claude if not already logged in\n";
    out << "  2. Open DevTools (F12 or Ctrl+Shift+I)\n";
    out << "  3. Go to: Application/Storage tab → Cookies → https://claude.ai\n";
    out << "  4. Find the 'sessionKey' cookie\n";
    out << "  5. Double-click the Value to select it, then copy (Ctrl+C)\n\n";
    out << "Paste your sessionKey here: " << std::flush;

    std::string raw;
    if (!std::getline(in, raw)) {
        err << "Failed to read session key." << std::endl;
        return std::nullopt;
    }

    AuthSession session;
    session.session_key = clean_session_key(raw);
    if (session.session_key.empty()) {
        err << "No session key provided." << std::endl;
        return std::nullopt;
    }

    if (const auto saved = store.save_session(session); !saved.success) {
        err << "Failed to save session: " << saved.error_message << std::endl;
        return std::nullopt;
    }

    out << "\n✓ Session saved successfully!\n\n";
    return session;
}

std::optional<AuthSession> run_login_flow(IConfigStore& store, std::istream& in, std::ostream& out,
                                          std::ostream& err) {
    auto session = prompt_for_session(store, in, out, err);
    if (!session) {
        err << "Login failed." << std::endl;
        return std::nullopt;
    }

    ClaudeUsageClient client(*session);
    if (const auto error = client.test_session()) {
        err << "Session validation failed: " << error->message << std::endl;
        out << "The session key may be invalid. Please try again.\n";
        return std::nullopt;
    }

    session->organization_id = client.organization_id();
    if (const auto saved = store.save_session(*session); !saved.success) {
        err << "Failed to save organization ID: " << saved.error_message << std::endl;
    }

    out << "✓ Session validated successfully!\n\n";
    spdlog::info("[auth] logged in, organization {}", session->organization_id);

    if (auto result = client.fetch_usage(); result.ok()) {
        out << format_console_report(*result.snapshot, std::chrono::system_clock::now());
    } else if (result.error) {
        out << "Note: Could not fetch usage data: " << result.error->message << "\n\n";
    }
    return session;
}

} // namespace cml
