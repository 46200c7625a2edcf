#include "rest_client.hpp"
#include "util.hpp"

namespace rest_retry {

namespace {

constexpr const char* kComponent = "RestClient";

Event makeEvent(EventLevel level, const char* message, const RequestConfig& config) {
    Event event;
    event.level     = level;
    event.component = kComponent;
    event.message   = message;
    event.url       = config.url();
    return event;
}

std::chrono::milliseconds saturatingAdd(std::chrono::milliseconds total,
                                        std::chrono::milliseconds wait) {
    if (total > std::chrono::milliseconds::max() - wait) {
        return std::chrono::milliseconds::max();
    }
    return total + wait;
}

} // namespace

RestClient::RestClient(Transport& transport, EventSink& sink)
    : RestClient(transport, sink,
                 [](const CallContext& ctx, std::chrono::milliseconds wait) {
                     return ctx.sleepFor(wait);
                 }) {}

RestClient::RestClient(Transport& transport, EventSink& sink, Sleeper sleeper)
    : mTransport(transport)
    , mSink(sink)
    , mSleeper(std::move(sleeper)) {}

// ---------------------------------------------------------------------------
// Retry loop
// ---------------------------------------------------------------------------

Outcome RestClient::runAttempts(const CallContext& ctx,
                                const RequestConfig& config,
                                const nlohmann::json& request,
                                std::string& body) const {
    Outcome                   outcome;
    AttemptResult             last;
    std::chrono::milliseconds wait{0};

    for (int attempt = 0; attempt < config.maxAttempts(); ++attempt) {
        if (attempt > 0) {
            outcome.totalWait = saturatingAdd(outcome.totalWait, wait);
            if (!mSleeper(ctx, wait)) {
                // The next attempt sees the cancelled / expired context
                // and fails fast; it still counts as an attempt.
                Event event = makeEvent(EventLevel::Debug, "backoff interrupted", config);
                event.attempt = attempt + 1;
                mSink.record(event);
            }
        }

        last = mTransport.invoke(ctx, config, request);
        ++outcome.attempts;

        // Resolved (success or a handled client-side status), or an
        // error that another attempt cannot fix.
        if (!isRetryable(last)) break;
        if (attempt + 1 == config.maxAttempts()) break;

        ++outcome.retries;
        wait = computeBackoff(config.intervalSeconds(), config.backoffRate(), attempt);

        Event event   = makeEvent(EventLevel::Warn, "retrying request", config);
        event.status  = last.status;
        event.wait    = wait;
        event.attempt = outcome.attempts;
        if (last.error) event.error = errorMessage(*last.error);
        mSink.record(event);
    }

    if (last.error) {
        Event event   = makeEvent(EventLevel::Error, "error calling api", config);
        event.status  = last.status;
        event.error   = errorMessage(*last.error);
        event.attempt = outcome.attempts;
        mSink.record(event);

        outcome.status = kInternalFailureStatus;
        outcome.error  = std::move(last.error);
        return outcome;
    }

    outcome.status = last.status;

    if (last.status >= kServerErrorThreshold) {
        outcome.error = RetriesExhausted{last.status, outcome.attempts};

        Event event   = makeEvent(EventLevel::Error, "retries exhausted", config);
        event.status  = last.status;
        event.error   = errorMessage(*outcome.error);
        event.attempt = outcome.attempts;
        mSink.record(event);
        return outcome;
    }

    body = std::move(last.body);
    return outcome;
}

bool RestClient::isRetryable(const AttemptResult& result) {
    if (result.status < kServerErrorThreshold) return false;
    if (!result.error) return true;

    switch (errorKind(*result.error)) {
        case ErrorKind::Transport:
        case ErrorKind::ResponseRead:
            return true;
        default:
            return false;
    }
}

// ---------------------------------------------------------------------------
// Completion
// ---------------------------------------------------------------------------

Outcome RestClient::decodeFailure(Outcome outcome,
                                  const RequestConfig& config,
                                  const std::string& what) const {
    DecodeError error;
    error.message    = what;
    error.httpStatus = outcome.status;

    Event event  = makeEvent(EventLevel::Error, "failed to decode response", config);
    event.status = outcome.status;
    event.error  = errorMessage(error);
    mSink.record(event);

    outcome.status = kInternalFailureStatus;
    outcome.error  = std::move(error);
    return outcome;
}

Outcome RestClient::succeed(Outcome outcome, const RequestConfig& config) const {
    Event event   = makeEvent(EventLevel::Debug, "request done", config);
    event.status  = outcome.status;
    event.retries = outcome.retries;
    mSink.record(event);
    return outcome;
}

} // namespace rest_retry
