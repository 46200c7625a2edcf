#pragma once

#include <chrono>
#include <map>
#include <string>

namespace rest_retry {

/// Everything needed to issue and retry one logical HTTP call.
/// Only Builder::build() creates instances, so a RequestConfig is always
/// valid and never changes after construction.
class RequestConfig {
public:
    using Headers = std::map<std::string, std::string>;

    class Builder;

    const std::string& method() const { return mMethod; }
    const std::string& url() const { return mUrl; }
    const Headers&     headers() const { return mHeaders; }

    /// Per-attempt network timeout; zero means no explicit cap.
    std::chrono::milliseconds timeout() const { return mTimeout; }

    int    maxAttempts() const { return mMaxAttempts; }
    double intervalSeconds() const { return mIntervalSeconds; }
    double backoffRate() const { return mBackoffRate; }

private:
    RequestConfig() = default;

    std::string               mMethod = "GET";
    std::string               mUrl;
    Headers                   mHeaders;
    std::chrono::milliseconds mTimeout{0};
    int                       mMaxAttempts     = 1;
    double                    mIntervalSeconds = 0.0;
    double                    mBackoffRate     = 0.0;
};

/// Fluent builder. Every with*() returns a modified copy, so partially
/// built values can be shared and extended without affecting each other.
class RequestConfig::Builder {
public:
    Builder() = default;

    Builder withMethod(std::string method) const;
    Builder withUrl(std::string url) const;
    /// Replaces the whole header map.
    Builder withHeaders(Headers headers) const;
    /// Adds or overwrites a single header.
    Builder withHeader(const std::string& name, std::string value) const;
    Builder withTimeout(std::chrono::milliseconds timeout) const;
    Builder withMaxAttempts(int maxAttempts) const;
    Builder withIntervalSeconds(double intervalSeconds) const;
    Builder withBackoffRate(double backoffRate) const;

    /// @throws std::invalid_argument when the configuration is unusable.
    RequestConfig build() const;

private:
    RequestConfig mConfig;
};

} // namespace rest_retry
