#include "event_sink.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace rest_retry {

const char* toString(EventLevel level) {
    switch (level) {
        case EventLevel::Debug: return "DEBUG";
        case EventLevel::Info:  return "INFO";
        case EventLevel::Warn:  return "WARN";
        case EventLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

StreamEventSink::StreamEventSink(std::ostream& out, Format format, EventLevel minLevel)
    : mOut(out)
    , mFormat(format)
    , mMinLevel(minLevel) {}

void StreamEventSink::record(const Event& event) {
    if (event.level < mMinLevel) return;

    const std::string line = (mFormat == Format::Json) ? formatJson(event)
                                                       : formatText(event);
    std::lock_guard<std::mutex> lock(mMutex);
    mOut << line << '\n';
    mOut.flush();
}

// ---------------------------------------------------------------------------
// Renderers
// ---------------------------------------------------------------------------

std::string StreamEventSink::formatText(const Event& event) {
    std::ostringstream os;
    os << "[" << (event.component.empty() ? "rest_retry" : event.component)
       << "] " << toString(event.level) << " " << event.message;

    if (!event.url.empty()) os << " url=" << event.url;
    if (event.status)       os << " status=" << *event.status;
    if (event.error)        os << " error=\"" << *event.error << "\"";
    if (event.wait) {
        os << " wait=" << std::fixed << std::setprecision(3)
           << static_cast<double>(event.wait->count()) / 1000.0 << "s";
    }
    if (event.attempt)      os << " attempt=" << *event.attempt;
    if (event.retries)      os << " retries=" << *event.retries;
    os << " time=" << formatRfc3339(event.time);
    return os.str();
}

std::string StreamEventSink::formatJson(const Event& event) {
    nlohmann::json j;
    j["time"]  = formatRfc3339(event.time);
    j["level"] = toString(event.level);
    j["msg"]   = event.message;
    if (!event.component.empty()) j["component"] = event.component;
    if (!event.url.empty())       j["url"]       = event.url;
    if (event.status)             j["status"]    = *event.status;
    if (event.error)              j["error"]     = *event.error;
    if (event.wait) {
        j["wait"] = static_cast<double>(event.wait->count()) / 1000.0;
    }
    if (event.attempt)            j["attempt"]   = *event.attempt;
    if (event.retries)            j["retries"]   = *event.retries;

    // Errors may carry bytes from the wire; never let them break the line.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace rest_retry
