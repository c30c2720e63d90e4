#include "indicator_state.hpp"

namespace cml {

template <typename Fn>
void IndicatorState::update(Fn&& fn) {
    std::function<void()> callback;
    {
        std::lock_guard lock(mutex_);
        if (!fn(model_)) return;
        callback = on_changed_;
    }
    if (callback) {
        callback();
    }
}

void IndicatorState::set_title(const std::string& title, const UsageTier tier) {
    update([&](IndicatorViewModel& vm) {
        if (vm.title == title && vm.tier == tier) return false;
        vm.title = title;
        vm.tier = tier;
        return true;
    });
}

void IndicatorState::set_line(const UsageWindow window, const std::string& text) {
    update([&](IndicatorViewModel& vm) {
        auto& line = vm.lines[window_index(window)];
        if (line == text) return false;
        line = text;
        return true;
    });
}

void IndicatorState::set_selected(const DisplayMode mode) {
    update([&](IndicatorViewModel& vm) {
        if (vm.selected == mode) return false;
        vm.selected = mode;
        return true;
    });
}

void IndicatorState::set_session_expired(const bool expired) {
    update([&](IndicatorViewModel& vm) {
        if (vm.session_expired == expired) return false;
        vm.session_expired = expired;
        return true;
    });
}

IndicatorViewModel IndicatorState::snapshot() const {
    std::lock_guard lock(mutex_);
    return model_;
}

void IndicatorState::set_on_changed(std::function<void()> callback) {
    std::lock_guard lock(mutex_);
    on_changed_ = std::move(callback);
}

} // namespace cml
