#pragma once

#include "call_context.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "request_config.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace rest_retry {

/// Terminal result of one logical call.
struct Outcome {
    int64_t                   status = kInternalFailureStatus;
    std::optional<CallError>  error;

    int                       attempts = 0;
    /// Attempts that were followed by another one. When every attempt
    /// fails this is attempts - 1, not attempts: the last failure ends the
    /// loop instead of scheduling a retry.
    int                       retries  = 0;
    /// Sum of backoff waits, saturating at milliseconds::max().
    std::chrono::milliseconds totalWait{0};

    bool ok() const { return !error.has_value(); }
};

/// Runs one logical request through a Transport, retrying server errors
/// and transport failures with exponential backoff, then decodes the body.
///
/// The client holds no per-call state, so one instance may serve
/// concurrent execute() calls.
class RestClient {
public:
    /// Waits between attempts. Returns false when the wait was cut short.
    using Sleeper = std::function<bool(const CallContext&, std::chrono::milliseconds)>;

    static constexpr int64_t kServerErrorThreshold = 500;

    RestClient(Transport& transport, EventSink& sink);
    RestClient(Transport& transport, EventSink& sink, Sleeper sleeper);

    /// Execute @p request under @p config and decode the final response
    /// body into @p response (any type nlohmann::json can convert to).
    ///
    /// On success returns the real HTTP status (which may be a 4xx) and
    /// assigns @p response. On failure @p response is left untouched and
    /// the outcome carries the error; status is kInternalFailureStatus
    /// except for RetriesExhausted, which reports the last HTTP status.
    template <typename T>
    Outcome execute(const CallContext& ctx,
                    const RequestConfig& config,
                    const nlohmann::json& request,
                    T& response) const {
        std::string body;
        Outcome outcome = runAttempts(ctx, config, request, body);
        if (!outcome.ok()) return outcome;

        try {
            T decoded = nlohmann::json::parse(body).template get<T>();
            response  = std::move(decoded);
        } catch (const nlohmann::json::exception& e) {
            return decodeFailure(std::move(outcome), config, e.what());
        }
        return succeed(std::move(outcome), config);
    }

private:
    Transport& mTransport;
    EventSink& mSink;
    Sleeper    mSleeper;

    /// The retry loop. Leaves the final response body in @p body when the
    /// returned outcome is ok().
    Outcome runAttempts(const CallContext& ctx,
                        const RequestConfig& config,
                        const nlohmann::json& request,
                        std::string& body) const;

    Outcome decodeFailure(Outcome outcome,
                          const RequestConfig& config,
                          const std::string& what) const;
    Outcome succeed(Outcome outcome, const RequestConfig& config) const;

    static bool isRetryable(const AttemptResult& result);
};

} // namespace rest_retry
