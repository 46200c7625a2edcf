#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace rest_retry {

/// Deadline + cancellation signal threaded through one logical call.
/// Copies share the same cancellation state; cancel() is thread-safe.
class CallContext {
public:
    using Clock = std::chrono::steady_clock;

    /// A context with no deadline that is never cancelled unless asked.
    CallContext();

    static CallContext withTimeout(std::chrono::milliseconds timeout);
    static CallContext withDeadline(Clock::time_point deadline);

    std::optional<Clock::time_point> deadline() const { return mDeadline; }

    /// Time left before the deadline (zero when passed, nullopt when none).
    std::optional<std::chrono::milliseconds> remaining() const;

    void cancel() const;
    bool isCancelled() const;
    bool isDeadlineExceeded() const;
    bool isDone() const { return isCancelled() || isDeadlineExceeded(); }

    /// Sleep for @p duration, waking early on cancellation or deadline.
    /// Returns false when the sleep was cut short.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    cancelled = false;
    };

    std::shared_ptr<State>           mState;
    std::optional<Clock::time_point> mDeadline;
};

} // namespace rest_retry
