#include "call_context.hpp"
#include "errors.hpp"
#include "event_sink.hpp"
#include "request_config.hpp"
#include "rest_client.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

struct CliOptions {
    std::string method          = "GET";
    std::string url;
    std::map<std::string, std::string> headers{{"Content-Type", "application/json"}};
    std::string data;
    int         timeoutMs       = 10000;
    int         maxAttempts     = 3;
    double      intervalSeconds = 1.0;
    double      backoffRate     = 2.0;
    int         deadlineMs      = 60000;
    bool        jsonLog         = false;
    bool        verbose         = false;
};

static void printUsage() {
    std::cout
        << "Usage: rest_retry --url URL [options]\n\n"
        << "Options:\n"
        << "  --url URL              Target endpoint (required)\n"
        << "  --method VERB          HTTP method                  (default: GET)\n"
        << "  --header 'K: V'        Extra header, repeatable\n"
        << "  --data JSON            Request body as JSON\n"
        << "  --timeout-ms N         Per-attempt timeout, 0 = none (default: 10000)\n"
        << "  --max-attempts N       Attempts including the first (default: 3)\n"
        << "  --interval-seconds X   Base backoff interval        (default: 1)\n"
        << "  --backoff-rate X       Backoff multiplier           (default: 2)\n"
        << "  --deadline-ms N        Deadline for the whole call  (default: 60000)\n"
        << "  --json-log             Emit log events as JSON lines\n"
        << "  --verbose              Include debug events\n"
        << "  --help, -h             Show this message\n";
}

[[noreturn]] static void usageError(const std::string& message) {
    std::cerr << message << "\n\n";
    printUsage();
    std::exit(2);
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--url" && hasValue) {
            opts.url = argv[++i];
        } else if (arg == "--method" && hasValue) {
            opts.method = argv[++i];
        } else if (arg == "--header" && hasValue) {
            std::string header = argv[++i];
            auto colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                usageError("Malformed header (expected 'Name: value'): " + header);
            }
            std::string value = header.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            opts.headers[header.substr(0, colon)] = value;
        } else if (arg == "--data" && hasValue) {
            opts.data = argv[++i];
        } else if (arg == "--timeout-ms" && hasValue) {
            opts.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--max-attempts" && hasValue) {
            opts.maxAttempts = std::stoi(argv[++i]);
        } else if (arg == "--interval-seconds" && hasValue) {
            opts.intervalSeconds = std::stod(argv[++i]);
        } else if (arg == "--backoff-rate" && hasValue) {
            opts.backoffRate = std::stod(argv[++i]);
        } else if (arg == "--deadline-ms" && hasValue) {
            opts.deadlineMs = std::stoi(argv[++i]);
        } else if (arg == "--json-log") {
            opts.jsonLog = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            usageError("Unknown argument: " + arg);
        }
    }

    if (opts.url.empty()) {
        usageError("Missing required --url");
    }
    return opts;
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::logic_error& e) {
        // std::stoi / std::stod on a non-number.
        usageError(std::string("Invalid numeric option: ") + e.what());
    }

    nlohmann::json request;
    if (!opts.data.empty()) {
        try {
            request = nlohmann::json::parse(opts.data);
        } catch (const nlohmann::json::parse_error& e) {
            usageError(std::string("--data is not valid JSON: ") + e.what());
        }
    }

    rest_retry::RequestConfig config = [&] {
        try {
            return rest_retry::RequestConfig::Builder()
                .withMethod(opts.method)
                .withUrl(opts.url)
                .withHeaders(opts.headers)
                .withTimeout(std::chrono::milliseconds(opts.timeoutMs))
                .withIntervalSeconds(opts.intervalSeconds)
                .withBackoffRate(opts.backoffRate)
                .withMaxAttempts(opts.maxAttempts)
                .build();
        } catch (const std::invalid_argument& e) {
            usageError(e.what());
        }
    }();

    rest_retry::StreamEventSink sink(
        std::cerr,
        opts.jsonLog ? rest_retry::StreamEventSink::Format::Json
                     : rest_retry::StreamEventSink::Format::Text,
        opts.verbose ? rest_retry::EventLevel::Debug
                     : rest_retry::EventLevel::Info);

    rest_retry::BeastTransport transport(&sink);
    rest_retry::RestClient     client(transport, sink);

    auto ctx = rest_retry::CallContext::withTimeout(
        std::chrono::milliseconds(opts.deadlineMs));

    nlohmann::json response;
    const auto outcome = client.execute(ctx, config, request, response);

    if (!outcome.ok()) {
        std::cerr << "Request failed ("
                  << rest_retry::toString(rest_retry::errorKind(*outcome.error))
                  << ", status " << outcome.status << "): "
                  << rest_retry::errorMessage(*outcome.error) << "\n";
        return 1;
    }

    std::cout << "HTTP " << outcome.status
              << "  (attempts: " << outcome.attempts
              << ", retries: " << outcome.retries << ")\n"
              << response.dump(2) << "\n";
    return 0;
}
