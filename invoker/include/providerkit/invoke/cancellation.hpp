#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace providerkit {
namespace invoke {

// Cancellation signal shared between a run and whoever may abort it.
// cancel() may be called from any thread; the first reason wins.
class CancellationToken {
public:
    void cancel(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return;
            }
            reason_ = reason;
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        return cancelled_.load();
    }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    // Waits up to `duration`. Returns true if the token fired before the time elapsed.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::string reason_;
};

// Clock/sleep abstraction used by the synchronous loop driver
class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Returns false if the wait was interrupted by cancellation
    virtual bool sleep_for(std::chrono::seconds delay, const CancellationToken& token) = 0;
};

// Blocks the calling thread, but wakes up as soon as the token is cancelled
class InterruptibleSleeper : public Sleeper {
public:
    bool sleep_for(std::chrono::seconds delay, const CancellationToken& token) override {
        if (token.is_cancelled()) {
            return false;
        }
        if (delay.count() <= 0) {
            return true;
        }
        return !token.wait_for(delay);
    }
};

} // namespace invoke
} // namespace providerkit
