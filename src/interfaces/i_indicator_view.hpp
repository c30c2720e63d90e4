#pragma once

#include "../usage_snapshot.hpp"
#include "../viewmodels/indicator_view_model.hpp"
#include <string>

namespace cml {

// Sink for the compact indicator and the selection menu.
// Written by the scheduler's dispatch loop only.
class IIndicatorView {
public:
    virtual ~IIndicatorView() = default;

    virtual void set_title(const std::string& title, UsageTier tier) = 0;
    virtual void set_line(UsageWindow window, const std::string& text) = 0;
    virtual void set_selected(DisplayMode mode) = 0;
    virtual void set_session_expired(bool expired) = 0;
};

} // namespace cml
