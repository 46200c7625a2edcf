#include "request_config.hpp"

#include <cmath>
#include <stdexcept>

namespace rest_retry {

RequestConfig::Builder RequestConfig::Builder::withMethod(std::string method) const {
    Builder next = *this;
    next.mConfig.mMethod = std::move(method);
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withUrl(std::string url) const {
    Builder next = *this;
    next.mConfig.mUrl = std::move(url);
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withHeaders(Headers headers) const {
    Builder next = *this;
    next.mConfig.mHeaders = std::move(headers);
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withHeader(const std::string& name,
                                                          std::string value) const {
    Builder next = *this;
    next.mConfig.mHeaders[name] = std::move(value);
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withTimeout(std::chrono::milliseconds timeout) const {
    Builder next = *this;
    next.mConfig.mTimeout = timeout;
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withMaxAttempts(int maxAttempts) const {
    Builder next = *this;
    next.mConfig.mMaxAttempts = maxAttempts;
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withIntervalSeconds(double intervalSeconds) const {
    Builder next = *this;
    next.mConfig.mIntervalSeconds = intervalSeconds;
    return next;
}

RequestConfig::Builder RequestConfig::Builder::withBackoffRate(double backoffRate) const {
    Builder next = *this;
    next.mConfig.mBackoffRate = backoffRate;
    return next;
}

RequestConfig RequestConfig::Builder::build() const {
    const RequestConfig& c = mConfig;

    if (c.mMethod.empty()) {
        throw std::invalid_argument("RequestConfig: method must not be empty");
    }
    if (c.mUrl.empty()) {
        throw std::invalid_argument("RequestConfig: url must not be empty");
    }
    if (c.mMaxAttempts < 1) {
        throw std::invalid_argument(
            "RequestConfig: maxAttempts must be >= 1 (got " +
            std::to_string(c.mMaxAttempts) + ")");
    }
    if (!std::isfinite(c.mIntervalSeconds) || c.mIntervalSeconds < 0.0) {
        throw std::invalid_argument("RequestConfig: intervalSeconds must be >= 0");
    }
    if (!std::isfinite(c.mBackoffRate) || c.mBackoffRate < 0.0) {
        throw std::invalid_argument("RequestConfig: backoffRate must be >= 0");
    }
    if (c.mTimeout.count() < 0) {
        throw std::invalid_argument("RequestConfig: timeout must be >= 0");
    }
    return c;
}

} // namespace rest_retry
