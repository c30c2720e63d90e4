#pragma once

#include "interfaces/i_config_store.hpp"
#include "interfaces/i_process_control.hpp"
#include "interfaces/i_usage_client.hpp"
#include "single_instance.hpp"
#include <chrono>
#include <iosfwd>

namespace cml {

// Grace period between SIGTERM and removing the marker
inline constexpr auto kStopWait = std::chrono::milliseconds(500);

void print_usage(std::ostream& out);

// Fetch once and print the console report. False (and nothing printed) on
// failure.
bool print_usage_report(IUsageClient& client, std::ostream& out);

// `stop`: no-op success when nothing is running; otherwise SIGTERM the
// recorded process, wait, and remove the marker. Returns the exit status.
int run_stop(SingleInstance& instance, IProcessControl& process_control, std::ostream& out, std::ostream& err,
             std::chrono::milliseconds wait = kStopWait);

// `logout`: best-effort stop, then remove all persisted config
int run_logout(SingleInstance& instance, IProcessControl& process_control, IConfigStore& store,
               std::ostream& out, std::ostream& err, std::chrono::milliseconds wait = kStopWait);

// Shown instead of starting when an instance is already active
int run_status(SingleInstance& instance, IConfigStore& store, IUsageClient& client, std::ostream& out,
               std::ostream& err);

} // namespace cml
