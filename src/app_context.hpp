#pragma once

#include "interfaces/i_config_store.hpp"
#include "interfaces/i_indicator_view.hpp"
#include "interfaces/i_usage_client.hpp"
#include "single_instance.hpp"
#include "usage_cache.hpp"

namespace cml {

// Everything the scheduler shares with the rest of the program. Built once in
// main (or a test) and passed by reference; the pointed-to collaborators must
// outlive every user of the context.
struct AppContext {
    IUsageClient* usage_client = nullptr;
    IConfigStore* config_store = nullptr;
    IIndicatorView* indicator = nullptr;
    SingleInstance* instance = nullptr;  // null when running in the foreground

    UsageCache cache;
};

} // namespace cml
