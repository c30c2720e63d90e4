#include "usage_client.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <ctime>
#include <memory>

namespace cml {

using json = nlohmann::json;

namespace {

constexpr const char* kApiBaseUrl = "https://claude.ai/api";
constexpr const char* kUserAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36";
constexpr long kRequestTimeoutSeconds = 10;

size_t write_callback(void* contents, const size_t size, const size_t nmemb, std::string* out) {
    const size_t total = size * nmemb;
    out->append(static_cast<const char*>(contents), total);
    return total;
}

bool is_auth_status(const long status) {
    return status == 401 || status == 403;
}

// Parse a fixed-width run of digits
bool parse_digits(std::string_view text, const size_t pos, const size_t len, int& out) {
    if (pos + len > text.size()) return false;
    const auto* first = text.data() + pos;
    const auto* last = first + len;
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

std::optional<UsageLimit> parse_limit(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || !it->is_object()) {
        return std::nullopt;
    }

    UsageLimit limit;
    if (const auto u = it->find("utilization"); u != it->end() && u->is_number()) {
        limit.utilization = u->get<double>();
    }
    if (const auto r = it->find("resets_at"); r != it->end() && r->is_string()) {
        limit.resets_at = ClaudeUsageClient::parse_rfc3339(r->get<std::string>());
    }
    return limit;
}

std::optional<std::string> extract_org_id(const json& org) {
    if (!org.is_object()) return std::nullopt;
    for (const char* key : {"uuid", "id"}) {
        if (const auto it = org.find(key); it != org.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

} // namespace

ClaudeUsageClient::ClaudeUsageClient(const AuthSession& session)
    : session_key_(session.session_key)
    , organization_id_(session.organization_id)
{
}

std::string ClaudeUsageClient::organization_id() const {
    std::lock_guard lock(org_mutex_);
    return organization_id_;
}

ClaudeUsageClient::HttpResponse ClaudeUsageClient::http_get(const std::string& url) const {
    HttpResponse out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.error = "curl_easy_init failed";
        return out;
    }

    const std::string cookie = "Cookie: sessionKey=" + session_key_;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, cookie.c_str());
    headers = curl_slist_append(headers, "Accept: application/json");

    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, kRequestTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    if (const CURLcode code = curl_easy_perform(curl); code != CURLE_OK) {
        out.error = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(code));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return out;
}

std::optional<FetchError> ClaudeUsageClient::ensure_organization_id() {
    if (!organization_id().empty()) {
        return std::nullopt;
    }

    const auto response = http_get(fmt::format("{}/organizations", kApiBaseUrl));
    if (!response.error.empty()) {
        return FetchError{FetchErrorKind::Other, "failed to fetch organizations: " + response.error};
    }
    if (is_auth_status(response.status)) {
        return FetchError{FetchErrorKind::AuthFailure,
                          fmt::format("authentication failed (status {})", response.status)};
    }
    if (response.status != 200) {
        return FetchError{FetchErrorKind::Other,
                          fmt::format("failed to fetch organizations (status {})", response.status)};
    }

    const auto org_id = parse_organization_id(response.body);
    if (!org_id) {
        return FetchError{FetchErrorKind::Other, "organization ID not found in response"};
    }

    spdlog::info("[client] organization {} discovered", *org_id);
    std::lock_guard lock(org_mutex_);
    organization_id_ = *org_id;
    return std::nullopt;
}

FetchResult ClaudeUsageClient::fetch_usage() {
    if (const auto error = ensure_organization_id()) {
        return {nullptr, error};
    }

    const auto url = fmt::format("{}/organizations/{}/usage", kApiBaseUrl, organization_id());
    const auto response = http_get(url);

    if (!response.error.empty()) {
        return FetchResult::failure(FetchErrorKind::Other, "failed to fetch usage limits: " + response.error);
    }
    if (is_auth_status(response.status)) {
        return FetchResult::failure(FetchErrorKind::AuthFailure,
                                    fmt::format("authentication failed (status {})", response.status));
    }
    if (response.status != 200) {
        return FetchResult::failure(FetchErrorKind::Other,
                                    fmt::format("unexpected status code {}: {}", response.status, response.body));
    }

    return parse_usage_response(response.body, std::chrono::system_clock::now());
}

std::optional<FetchError> ClaudeUsageClient::test_session() {
    auto result = fetch_usage();
    return result.error;
}

FetchResult ClaudeUsageClient::parse_usage_response(std::string_view body,
                                                    const std::chrono::system_clock::time_point now) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::parse_error& e) {
        return FetchResult::failure(FetchErrorKind::Other, fmt::format("failed to parse response: {}", e.what()));
    }

    if (!root.is_object()) {
        return FetchResult::failure(FetchErrorKind::Other, "failed to parse response: not an object");
    }

    auto snapshot = std::make_shared<UsageSnapshot>();
    snapshot->fetched_at = now;
    snapshot->limit(UsageWindow::CurrentSession) = parse_limit(root, "five_hour");
    snapshot->limit(UsageWindow::WeeklyAll) = parse_limit(root, "seven_day");
    snapshot->limit(UsageWindow::WeeklyOpus) = parse_limit(root, "seven_day_opus");

    return FetchResult::success(std::move(snapshot));
}

std::optional<std::string> ClaudeUsageClient::parse_organization_id(std::string_view body) {
    const auto root = json::parse(body, nullptr, false);
    if (root.is_discarded()) {
        return std::nullopt;
    }
    if (root.is_array()) {
        if (root.empty()) return std::nullopt;
        return extract_org_id(root.front());
    }
    return extract_org_id(root);
}

// 2025-01-15T18:23:00Z, 2025-01-15T18:23:00.123456+00:00
std::optional<std::chrono::system_clock::time_point> ClaudeUsageClient::parse_rfc3339(std::string_view text) {
    std::tm tm_val{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (text.size() < 20 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) || !parse_digits(text, 8, 2, day) ||
        !parse_digits(text, 11, 2, hour) || !parse_digits(text, 14, 2, minute) || !parse_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    size_t pos = 19;
    std::chrono::microseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        long long micros = 0;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
        fraction = std::chrono::microseconds(micros);
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int off_h = 0, off_m = 0;
        if (!parse_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !parse_digits(text, pos + 4, 2, off_m)) {
            return std::nullopt;
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    tm_val.tm_year = year - 1900;
    tm_val.tm_mon = month - 1;
    tm_val.tm_mday = day;
    tm_val.tm_hour = hour;
    tm_val.tm_min = minute;
    tm_val.tm_sec = second;

    const time_t utc = timegm(&tm_val);
    auto tp = std::chrono::system_clock::from_time_t(utc - offset_seconds);
    tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
    return tp;
}

} // namespace cml
