#include "events/event_sink.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

const char* eventStatusName(EventStatus status) {
    switch (status) {
        case EventStatus::Start: return "start";
        case EventStatus::Data: return "data";
        case EventStatus::Error: return "error";
    }
    return "error";
}

EventPayload EventPayload::start(std::string message) {
    EventPayload p;
    p.status = EventStatus::Start;
    p.message = std::move(message);
    return p;
}

EventPayload EventPayload::data(const Segment& segment) {
    EventPayload p;
    p.status = EventStatus::Data;
    p.message = segment.text;
    p.segment = segment;
    return p;
}

EventPayload EventPayload::error(std::string message) {
    EventPayload p;
    p.status = EventStatus::Error;
    p.message = std::move(message);
    return p;
}

std::string toJson(const EventPayload& payload) {
    nlohmann::json j;
    j["event"] = "whisper";
    j["status"] = eventStatusName(payload.status);
    j["message"] = payload.message;
    if (payload.segment) {
        j["start"] = payload.segment->startMs;
        j["end"] = payload.segment->endMs;
    }
    return j.dump();
}

// Constructor
ConsoleEventSink::ConsoleEventSink(std::ostream& out) : out_(out) {}

bool ConsoleEventSink::emit(const EventPayload& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << toJson(payload) << "\n";
    out_.flush();
    return static_cast<bool>(out_);
}

void emitError(EventSink& sink, const std::string& message) {
    std::cerr << "[Events] [ERROR] " << message << std::endl;
    try {
        if (!sink.emit(EventPayload::error(message))) {
            std::cerr << "[Events] [WARN] error event could not be delivered" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Events] [WARN] error event threw: " << e.what() << std::endl;
    }
}
