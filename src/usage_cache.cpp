#include "usage_cache.hpp"
#include <mutex>

namespace cml {

std::shared_ptr<const UsageSnapshot> UsageCache::get() const {
    std::shared_lock lock(mutex_);
    return latest_;
}

void UsageCache::set(std::shared_ptr<const UsageSnapshot> snapshot) {
    if (!snapshot) return;

    std::unique_lock lock(mutex_);
    latest_ = std::move(snapshot);
}

void UsageCache::set(UsageSnapshot snapshot) {
    set(std::make_shared<const UsageSnapshot>(std::move(snapshot)));
}

bool UsageCache::empty() const {
    std::shared_lock lock(mutex_);
    return latest_ == nullptr;
}

} // namespace cml
