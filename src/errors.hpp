#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace rest_retry {

/// Status reported when no usable HTTP status was obtained.
constexpr int64_t kInternalFailureStatus = 999;

/// Request payload could not be serialized.
struct EncodingError {
    std::string message;
};

/// Method, URL or headers could not form a valid request.
struct RequestConstructionError {
    std::string message;
};

/// Resolve / connect / write / header read failed, or the deadline or
/// cancellation cut the exchange short.
struct TransportError {
    std::string message;
    bool        deadlineExceeded = false;
    bool        cancelled        = false;
};

/// Status line and headers arrived but the body could not be read.
struct ResponseReadError {
    std::string message;
    int64_t     httpStatus = 0;
};

/// The exchange completed but the body does not match the expected shape.
struct DecodeError {
    std::string message;
    int64_t     httpStatus = 0;
};

/// Every attempt ended with a server error (>= 500) and no transport error.
struct RetriesExhausted {
    int64_t lastStatus = 0;
    int     attempts   = 0;
};

using CallError = std::variant<EncodingError,
                               RequestConstructionError,
                               TransportError,
                               ResponseReadError,
                               DecodeError,
                               RetriesExhausted>;

enum class ErrorKind {
    Encoding,
    RequestConstruction,
    Transport,
    ResponseRead,
    Decode,
    RetriesExhausted,
};

ErrorKind   errorKind(const CallError& error);
const char* toString(ErrorKind kind);

/// Human-readable description, e.g. "transport: connect: Connection refused".
std::string errorMessage(const CallError& error);

} // namespace rest_retry
