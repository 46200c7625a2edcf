#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <stdexcept>

namespace rest_retry {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(),
                   parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(0, "/");
        }
    }

    // Fragments never go on the wire.
    auto fragment = parts.target.find('#');
    if (fragment != std::string::npos) {
        parts.target.erase(fragment);
    }

    if (authority.find('@') != std::string::npos) {
        throw std::invalid_argument("Invalid URL (userinfo not supported): " + url);
    }

    // --- host / port ---
    std::string::size_type colon;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid URL (unterminated IPv6 literal): " + url);
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 == authority.size()) {
            colon = std::string::npos;
        } else if (authority[close + 1] == ':') {
            colon = close + 1;
        } else {
            throw std::invalid_argument("Invalid URL (junk after IPv6 literal): " + url);
        }
    } else {
        colon = authority.rfind(':');
        parts.host = authority.substr(0, colon);
    }

    if (colon == std::string::npos) {
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            parts.port.size() > 5 || std::stoi(parts.port) > 65535) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::chrono::milliseconds computeBackoff(double intervalSeconds,
                                         double backoffRate,
                                         int attemptIndex) {
    const double seconds =
        intervalSeconds * std::pow(backoffRate, attemptIndex + 1);
    if (!(seconds > 0.0)) {
        return std::chrono::milliseconds(0);
    }

    const double ms = std::min(seconds * 1000.0,
                               static_cast<double>(kMaxBackoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(ms)));
}

std::string formatRfc3339(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

bool isHttpToken(const std::string& s) {
    if (s.empty()) return false;
    static const std::string kExtra = "!#$%&'*+-.^_`|~";
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || kExtra.find(static_cast<char>(c)) != std::string::npos;
    });
}

} // namespace rest_retry
