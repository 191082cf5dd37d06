#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>

namespace ontograph {

// ─── OnceCell ──────────────────────────────────────────────────
// Holds a lazily built value. The first caller of getOrInit() builds it
// under a mutex; every later caller reads it through an atomic pointer
// without locking. reset() is not safe against concurrent readers.

template <typename T>
class OnceCell {
public:
    OnceCell() = default;
    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;

    template <typename Init>
    const T& getOrInit(Init&& init) {
        const T* ready = published_.load(std::memory_order_acquire);
        if (ready) return *ready;

        std::lock_guard<std::mutex> lock(mutex_);
        ready = published_.load(std::memory_order_relaxed);
        if (!ready) {
            value_ = std::make_unique<T>(std::forward<Init>(init)());
            ready = value_.get();
            published_.store(ready, std::memory_order_release);
        }
        return *ready;
    }

    bool initialized() const { return published_.load(std::memory_order_acquire) != nullptr; }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.store(nullptr, std::memory_order_release);
        value_.reset();
    }

private:
    std::mutex mutex_;
    std::unique_ptr<T> value_;
    std::atomic<const T*> published_{nullptr};
};

} // namespace ontograph
