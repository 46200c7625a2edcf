#pragma once

#include "call_context.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "request_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace rest_retry {

/// Result of one HTTP exchange.
struct AttemptResult {
    int64_t                  status = kInternalFailureStatus;
    std::string              body;    // empty whenever error is set
    std::optional<CallError> error;
};

/// Executes exactly one HTTP call.
class Transport {
public:
    virtual ~Transport() = default;

    /// Never throws for per-call failures: they come back in AttemptResult.
    virtual AttemptResult invoke(const CallContext& ctx,
                                 const RequestConfig& config,
                                 const nlohmann::json& request) = 0;
};

/// Transport built on Boost.Beast. Opens a fresh connection per call,
/// reads the full response and closes the connection before returning.
/// HTTPS is available when built with OpenSSL.
class BeastTransport : public Transport {
public:
    /// @param sink  Optional receiver for per-exchange diagnostics.
    explicit BeastTransport(EventSink* sink = nullptr);

    AttemptResult invoke(const CallContext& ctx,
                         const RequestConfig& config,
                         const nlohmann::json& request) override;

private:
    EventSink* mSink;

    void emit(EventLevel level, const std::string& message,
              const std::string& url,
              std::optional<int64_t> status = std::nullopt,
              std::optional<std::string> error = std::nullopt) const;
};

} // namespace rest_retry
