#include "call_context.hpp"
#include "util.hpp"

#include <algorithm>

namespace rest_retry {

CallContext::CallContext()
    : mState(std::make_shared<State>()) {}

CallContext CallContext::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

CallContext CallContext::withDeadline(Clock::time_point deadline) {
    CallContext ctx;
    ctx.mDeadline = deadline;
    return ctx;
}

std::optional<std::chrono::milliseconds> CallContext::remaining() const {
    if (!mDeadline) return std::nullopt;

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *mDeadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

void CallContext::cancel() const {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        mState->cancelled = true;
    }
    mState->cv.notify_all();
}

bool CallContext::isCancelled() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

bool CallContext::isDeadlineExceeded() const {
    return mDeadline && Clock::now() >= *mDeadline;
}

bool CallContext::sleepFor(std::chrono::milliseconds duration) const {
    if (duration <= std::chrono::milliseconds(0)) {
        return !isDone();
    }

    // Longer waits would overflow the clock's nanosecond representation.
    auto wakeAt = Clock::now() + std::min(duration, kMaxBackoff);
    const bool cutByDeadline = mDeadline && *mDeadline < wakeAt;
    if (cutByDeadline) {
        wakeAt = *mDeadline;
    }

    std::unique_lock<std::mutex> lock(mState->mutex);
    const bool cancelled = mState->cv.wait_until(
        lock, wakeAt, [this] { return mState->cancelled; });
    return !cancelled && !cutByDeadline;
}

} // namespace rest_retry
