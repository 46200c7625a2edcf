#include "transport.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef REST_RETRY_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace rest_retry {

namespace {

using Clock = CallContext::Clock;

constexpr auto        kPollInterval = std::chrono::milliseconds(5);
constexpr const char* kUserAgent    = "rest_retry/1.0";

enum class Abort { None, Cancelled, Deadline };

AttemptResult failure(CallError error) {
    AttemptResult result;
    result.status = kInternalFailureStatus;
    result.error  = std::move(error);
    return result;
}

std::string describe(const beast::error_code& ec, Abort reason) {
    if (reason == Abort::Cancelled) return "context canceled";
    if (reason == Abort::Deadline || ec == beast::error::timeout) {
        return "context deadline exceeded";
    }
    return ec.message();
}

TransportError transportError(const std::string& step,
                              const beast::error_code& ec,
                              Abort reason) {
    TransportError err;
    err.message          = step + ": " + describe(ec, reason);
    err.cancelled        = (reason == Abort::Cancelled);
    err.deadlineExceeded = !err.cancelled &&
                           (reason == Abort::Deadline || ec == beast::error::timeout);
    return err;
}

/// Earlier of the context deadline and now + timeout (when timeout > 0).
std::optional<Clock::time_point> attemptDeadline(const CallContext& ctx,
                                                 std::chrono::milliseconds timeout) {
    std::optional<Clock::time_point> deadline = ctx.deadline();
    if (timeout.count() > 0) {
        const auto capped = Clock::now() + timeout;
        if (!deadline || capped < *deadline) {
            deadline = capped;
        }
    }
    return deadline;
}

/// Runs one pending asynchronous step to completion on a private
/// io_context, invoking @p cancelIo once if the context is cancelled or the
/// attempt deadline passes while the step is in flight.
class StepRunner {
public:
    StepRunner(net::io_context& ioc,
               const CallContext& ctx,
               std::optional<Clock::time_point> deadline)
        : mIoc(ioc), mCtx(ctx), mDeadline(deadline) {}

    template <class CancelFn>
    Abort run(CancelFn&& cancelIo) {
        mIoc.restart();
        Abort reason = Abort::None;
        while (!mIoc.stopped()) {
            mIoc.run_for(kPollInterval);
            if (reason != Abort::None || mIoc.stopped()) continue;

            if (mCtx.isCancelled()) {
                reason = Abort::Cancelled;
            } else if (mDeadline && Clock::now() >= *mDeadline) {
                reason = Abort::Deadline;
            }
            if (reason != Abort::None) cancelIo();
        }
        return reason;
    }

    /// Arms the Beast stream timer so stalled reads and writes fail too.
    void arm(beast::tcp_stream& stream) const {
        if (mDeadline) {
            stream.expires_at(*mDeadline);
        } else {
            stream.expires_never();
        }
    }

private:
    net::io_context&                 mIoc;
    const CallContext&               mCtx;
    std::optional<Clock::time_point> mDeadline;
};

http::request<http::string_body> buildRequest(const RequestConfig& config,
                                              const UrlParts& parts,
                                              std::string body) {
    if (!isHttpToken(config.method())) {
        throw std::invalid_argument("invalid method \"" + config.method() + "\"");
    }

    http::request<http::string_body> req;
    req.method_string(config.method());
    req.target(parts.target);
    req.version(11);

    const bool defaultPort = (parts.scheme == "http"  && parts.port == "80") ||
                             (parts.scheme == "https" && parts.port == "443");
    // IPv6 literals go back in brackets.
    const std::string host = parts.host.find(':') == std::string::npos
                                 ? parts.host
                                 : "[" + parts.host + "]";
    req.set(http::field::host, defaultPort ? host : host + ":" + parts.port);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
    }

    for (const auto& [name, value] : config.headers()) {
        if (!isHttpToken(name)) {
            throw std::invalid_argument("invalid header name \"" + name + "\"");
        }
        if (value.find_first_of("\r\n") != std::string::npos) {
            throw std::invalid_argument("invalid value for header \"" + name + "\"");
        }
        req.set(name, value);
    }

    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

tcp::resolver::results_type resolve(net::io_context& ioc,
                                    StepRunner& runner,
                                    const UrlParts& parts,
                                    std::optional<CallError>& error) {
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    beast::error_code ec;

    resolver.async_resolve(parts.host, parts.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec      = e;
            results = std::move(r);
        });
    const Abort reason = runner.run([&resolver] { resolver.cancel(); });
    if (ec || reason != Abort::None) {
        error = transportError("resolve " + parts.host, ec, reason);
    }
    return results;
}

/// Write the request and read the whole response over an established
/// (and, for TLS, handshaken) stream.
template <class Stream>
AttemptResult exchange(Stream& stream,
                       StepRunner& runner,
                       http::request<http::string_body>& req) {
    auto& lowest = beast::get_lowest_layer(stream);
    auto  cancelIo = [&lowest] { lowest.cancel(); };
    beast::error_code ec;

    // Send.
    runner.arm(lowest);
    http::async_write(stream, req,
        [&ec](beast::error_code e, std::size_t) { ec = e; });
    Abort reason = runner.run(cancelIo);
    if (ec || reason != Abort::None) {
        return failure(transportError("write", ec, reason));
    }

    // Status line + headers.
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    runner.arm(lowest);
    http::async_read_header(stream, buffer, parser,
        [&ec](beast::error_code e, std::size_t) { ec = e; });
    reason = runner.run(cancelIo);
    if (ec || reason != Abort::None) {
        return failure(transportError("read response header", ec, reason));
    }

    const auto status = static_cast<int64_t>(parser.get().result_int());

    // Body.
    if (!parser.is_done()) {
        runner.arm(lowest);
        http::async_read(stream, buffer, parser,
            [&ec](beast::error_code e, std::size_t) { ec = e; });
        reason = runner.run(cancelIo);
        if (ec || reason != Abort::None) {
            ResponseReadError err;
            err.httpStatus = status;
            err.message    = "read response body: " + describe(ec, reason);
            return failure(err);
        }
    }

    AttemptResult result;
    result.status = status;
    result.body   = parser.release().body();
    return result;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(EventSink* sink)
    : mSink(sink) {}

void BeastTransport::emit(EventLevel level, const std::string& message,
                          const std::string& url,
                          std::optional<int64_t> status,
                          std::optional<std::string> error) const {
    if (mSink == nullptr) return;

    Event event;
    event.level     = level;
    event.component = "Transport";
    event.message   = message;
    event.url       = url;
    event.status    = status;
    event.error     = std::move(error);
    mSink->record(event);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

AttemptResult BeastTransport::invoke(const CallContext& ctx,
                                     const RequestConfig& config,
                                     const nlohmann::json& request) {
    const std::string& url = config.url();

    // Encode.
    std::string body;
    if (!request.is_null()) {
        try {
            body = request.dump();
        } catch (const nlohmann::json::exception& e) {
            emit(EventLevel::Error, "error encoding request", url,
                 std::nullopt, std::string(e.what()));
            return failure(EncodingError{e.what()});
        }
    }

    // Build.
    UrlParts parts;
    http::request<http::string_body> req;
    try {
        parts = parseUrl(url);
        req   = buildRequest(config, parts, std::move(body));
    } catch (const std::invalid_argument& e) {
        emit(EventLevel::Error, "error creating request", url,
             std::nullopt, std::string(e.what()));
        return failure(RequestConstructionError{e.what()});
    }

    if (ctx.isCancelled()) {
        return failure(TransportError{"context canceled", false, true});
    }
    if (ctx.isDeadlineExceeded()) {
        return failure(TransportError{"context deadline exceeded", true, false});
    }

    emit(EventLevel::Debug, "sending " + config.method() + " request", url);

    net::io_context ioc;
    StepRunner runner(ioc, ctx, attemptDeadline(ctx, config.timeout()));

    std::optional<CallError> error;
    const auto endpoints = resolve(ioc, runner, parts, error);
    if (error) {
        emit(EventLevel::Error, "error making request", url,
             std::nullopt, errorMessage(*error));
        return failure(std::move(*error));
    }

    AttemptResult result;
    beast::error_code ec;

    if (parts.scheme == "https") {
#ifdef REST_RETRY_HAS_SSL
        namespace ssl = net::ssl;

        ssl::context tls(ssl::context::tlsv12_client);
        tls.set_default_verify_paths();
        tls.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);
        stream.set_verify_callback(ssl::host_name_verification(parts.host));

        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
            result = failure(TransportError{"tls: failed to set SNI hostname"});
        } else {
            auto& lowest = beast::get_lowest_layer(stream);
            auto  cancelIo = [&lowest] { lowest.cancel(); };

            runner.arm(lowest);
            lowest.async_connect(endpoints,
                [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            Abort reason = runner.run(cancelIo);
            if (ec || reason != Abort::None) {
                result = failure(transportError("connect", ec, reason));
            } else {
                stream.async_handshake(ssl::stream_base::client,
                    [&ec](beast::error_code e) { ec = e; });
                reason = runner.run(cancelIo);
                if (ec || reason != Abort::None) {
                    result = failure(transportError("tls handshake", ec, reason));
                } else {
                    result = exchange(stream, runner, req);
                }
            }
            // Connection: close was requested; skip the TLS close_notify
            // round trip and drop the socket.
            lowest.close();
        }
#else
        result = failure(RequestConstructionError{
            "HTTPS not supported: built without OpenSSL"});
#endif
    } else {
        beast::tcp_stream stream(ioc);
        auto cancelIo = [&stream] { stream.cancel(); };

        runner.arm(stream);
        stream.async_connect(endpoints,
            [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        const Abort reason = runner.run(cancelIo);
        if (ec || reason != Abort::None) {
            result = failure(transportError("connect", ec, reason));
        } else {
            result = exchange(stream, runner, req);
        }

        // Graceful shutdown (non-critical errors are ignored).
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream.close();
    }

    if (result.error) {
        emit(EventLevel::Error, "error making request", url,
             std::nullopt, errorMessage(*result.error));
    } else {
        emit(EventLevel::Debug, "received response", url, result.status);
    }
    return result;
}

} // namespace rest_retry
