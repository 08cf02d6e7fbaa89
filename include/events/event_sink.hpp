#ifndef EVENT_SINK_HPP
#define EVENT_SINK_HPP

#include "stt/types.hpp"

#include <mutex>
#include <optional>
#include <ostream>
#include <string>

enum class EventStatus { Start, Data, Error };

const char* eventStatusName(EventStatus status);

struct EventPayload {
    EventStatus status = EventStatus::Start;
    std::string message;
    std::optional<Segment> segment;  // set for Data only

    static EventPayload start(std::string message);
    static EventPayload data(const Segment& segment);
    static EventPayload error(std::string message);
};

// {"event":"whisper","status":"data","message":"...","start":500,"end":1200}
std::string toJson(const EventPayload& payload);

// Receives lifecycle and segment notifications for the host application.
// emit() returns false when the channel to the host is unavailable.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual bool emit(const EventPayload& payload) = 0;
};

// Writes one JSON line per event. Used by the one-shot command line mode.
class ConsoleEventSink : public EventSink {
public:
    explicit ConsoleEventSink(std::ostream& out);

    bool emit(const EventPayload& payload) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Best-effort error notification; a failing channel is ignored.
void emitError(EventSink& sink, const std::string& message);

#endif
