#pragma once

#include <chrono>
#include <string>

namespace rest_retry {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;     // IPv6 literals without brackets
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/v1/items?limit=5")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Longest wait computeBackoff returns. Stays representable once added to
/// a steady_clock time point.
constexpr std::chrono::milliseconds kMaxBackoff =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24 * 365 * 100));

/// Wait that precedes the attempt following @p attemptIndex (0-based):
/// intervalSeconds * backoffRate^(attemptIndex + 1), capped at kMaxBackoff.
std::chrono::milliseconds computeBackoff(double intervalSeconds,
                                         double backoffRate,
                                         int attemptIndex);

/// RFC 3339 UTC timestamp with second precision, e.g. "2024-05-01T12:00:00Z".
std::string formatRfc3339(std::chrono::system_clock::time_point tp);

/// True when @p s is a valid HTTP token (RFC 7230 tchar+), as methods and
/// header names must be.
bool isHttpToken(const std::string& s);

} // namespace rest_retry
