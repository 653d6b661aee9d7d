#pragma once

#include <atomic>
#include <mutex>
#include <utility>

namespace ez {

// Write-once slot for data derived from immutable input.
// The initializer runs at most once even under concurrent first access;
// every caller sees the same completed value afterwards.
template <typename T>
class OnceCache {
public:
    OnceCache() = default;
    OnceCache(const OnceCache&) = delete;
    OnceCache& operator=(const OnceCache&) = delete;

    template <typename Init>
    const T& get_or_init(Init&& init) const {
        std::call_once(flag_, [&] {
            value_ = std::forward<Init>(init)();
            ready_.store(true, std::memory_order_release);
        });
        return value_;
    }

    bool ready() const noexcept {
        return ready_.load(std::memory_order_acquire);
    }

private:
    mutable std::once_flag flag_;
    mutable T value_{};
    mutable std::atomic<bool> ready_{false};
};

} // namespace ez
