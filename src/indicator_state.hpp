#pragma once

#include "interfaces/i_indicator_view.hpp"
#include "viewmodels/indicator_view_model.hpp"
#include <functional>
#include <mutex>

namespace cml {

// Thread-safe holder of the rendered indicator. The scheduler writes through
// IIndicatorView; frontends poll snapshot() or react to the change callback.
class IndicatorState : public IIndicatorView {
public:
    IndicatorState() = default;
    IndicatorState(const IndicatorState&) = delete;
    IndicatorState& operator=(const IndicatorState&) = delete;

    void set_title(const std::string& title, UsageTier tier) override;
    void set_line(UsageWindow window, const std::string& text) override;
    void set_selected(DisplayMode mode) override;
    void set_session_expired(bool expired) override;

    [[nodiscard]] IndicatorViewModel snapshot() const;

    // Called after every change, outside the lock, on the writer's thread
    void set_on_changed(std::function<void()> callback);

private:
    template <typename Fn>
    void update(Fn&& fn);

    mutable std::mutex mutex_;
    IndicatorViewModel model_;
    std::function<void()> on_changed_;
};

} // namespace cml
