#pragma once

#include "usage_snapshot.hpp"
#include <memory>
#include <shared_mutex>

namespace cml {

// Single slot holding the most recently fetched snapshot.
// Readers share the lock; a writer replaces the pointer wholesale, so a
// reader sees either the previous snapshot or the new one, never a mix.
// Overlapping writers: last writer wins.
class UsageCache {
public:
    UsageCache() = default;
    UsageCache(const UsageCache&) = delete;
    UsageCache& operator=(const UsageCache&) = delete;

    // Null before the first successful fetch
    [[nodiscard]] std::shared_ptr<const UsageSnapshot> get() const;

    void set(std::shared_ptr<const UsageSnapshot> snapshot);
    void set(UsageSnapshot snapshot);

    [[nodiscard]] bool empty() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const UsageSnapshot> latest_;
};

} // namespace cml
