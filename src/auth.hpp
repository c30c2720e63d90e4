#pragma once

#include "errors.hpp"
#include "interfaces/i_config_store.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cml {

// Strip whitespace and surrounding quotes from a pasted cookie value
[[nodiscard]] std::string clean_session_key(std::string_view raw);

// Launch the desktop's URL handler without waiting for it
OpResult open_browser(const std::string& url);

// Guide the user through copying the sessionKey cookie, then save it.
// Empty on cancelled or failed input; the reason goes to err.
std::optional<AuthSession> prompt_for_session(IConfigStore& store, std::istream& in, std::ostream& out,
                                              std::ostream& err);

// Prompt, validate the key against the usage endpoint, store the discovered
// organization ID and print the current usage. Empty when login failed.
std::optional<AuthSession> run_login_flow(IConfigStore& store, std::istream& in, std::ostream& out,
                                          std::ostream& err);

} // namespace cml
