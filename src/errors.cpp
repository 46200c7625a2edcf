#include "errors.hpp"

namespace rest_retry {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

ErrorKind errorKind(const CallError& error) {
    return std::visit(Overloaded{
        [](const EncodingError&)            { return ErrorKind::Encoding; },
        [](const RequestConstructionError&) { return ErrorKind::RequestConstruction; },
        [](const TransportError&)           { return ErrorKind::Transport; },
        [](const ResponseReadError&)        { return ErrorKind::ResponseRead; },
        [](const DecodeError&)              { return ErrorKind::Decode; },
        [](const RetriesExhausted&)         { return ErrorKind::RetriesExhausted; },
    }, error);
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Encoding:            return "encoding";
        case ErrorKind::RequestConstruction: return "request_construction";
        case ErrorKind::Transport:           return "transport";
        case ErrorKind::ResponseRead:        return "response_read";
        case ErrorKind::Decode:              return "decode";
        case ErrorKind::RetriesExhausted:    return "retries_exhausted";
    }
    return "unknown";
}

std::string errorMessage(const CallError& error) {
    std::string prefix = toString(errorKind(error));
    prefix += ": ";

    return prefix + std::visit(Overloaded{
        [](const EncodingError& e)            { return e.message; },
        [](const RequestConstructionError& e) { return e.message; },
        [](const TransportError& e)           { return e.message; },
        [](const ResponseReadError& e) {
            return e.message + " (HTTP " + std::to_string(e.httpStatus) + ")";
        },
        [](const DecodeError& e) {
            return e.message + " (HTTP " + std::to_string(e.httpStatus) + ")";
        },
        [](const RetriesExhausted& e) {
            return "gave up after " + std::to_string(e.attempts) +
                   " attempts, last HTTP status " + std::to_string(e.lastStatus);
        },
    }, error);
}

} // namespace rest_retry
