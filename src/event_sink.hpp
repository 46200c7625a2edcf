#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace rest_retry {

enum class EventLevel { Debug, Info, Warn, Error };

const char* toString(EventLevel level);

/// One structured observation emitted by the client.
struct Event {
    EventLevel  level = EventLevel::Info;
    std::string component;   // e.g. "RestClient"
    std::string message;     // e.g. "retrying request"
    std::string url;
    std::optional<int64_t>                   status;
    std::optional<std::string>               error;
    std::optional<int>                       attempt;
    std::optional<int>                       retries;
    std::optional<std::chrono::milliseconds> wait;
    std::chrono::system_clock::time_point    time = std::chrono::system_clock::now();
};

/// Receiver of client events. Implementations must tolerate concurrent
/// record() calls when one sink is shared by several clients.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void record(const Event& event) = 0;
};

/// Discards everything.
class NullEventSink : public EventSink {
public:
    void record(const Event&) override {}
};

/// Writes events as single lines, either human-readable text or JSON.
class StreamEventSink : public EventSink {
public:
    enum class Format { Text, Json };

    explicit StreamEventSink(std::ostream& out,
                             Format format = Format::Text,
                             EventLevel minLevel = EventLevel::Info);

    void record(const Event& event) override;

    void setMinLevel(EventLevel level) { mMinLevel = level; }

    static std::string formatText(const Event& event);
    static std::string formatJson(const Event& event);

private:
    std::ostream&           mOut;
    Format                  mFormat;
    std::atomic<EventLevel> mMinLevel;
    std::mutex              mMutex;
};

} // namespace rest_retry
