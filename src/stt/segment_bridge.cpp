#include "stt/segment_bridge.hpp"

#include "events/event_sink.hpp"
#include "store/transcript_store.hpp"
#include "stt/transcription_error.hpp"

#include <iostream>

// Constructor
SegmentBridge::SegmentBridge(TranscriptStore& store, EventSink& sink)
    : store_(store), sink_(sink) {}

// Strict UTF-8: no overlongs, no surrogates, nothing above U+10FFFF
bool isValidUtf8(const std::string& bytes) {
    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        const unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        // Allowed range of the second byte; rules out overlongs and surrogates
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (c >= 0xE1 && c <= 0xEF) {
            len = 3;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        if (s[i + 1] < lo || s[i + 1] > hi) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

void SegmentBridge::onNewSegment(const DecodeState& state) {
    const int index = state.segmentCount() - 1;
    const char* raw = index >= 0 ? state.segmentText(index) : nullptr;

    if (!raw || !isValidUtf8(raw)) {
        ++rejected_;
        std::cerr << "[Bridge] [WARN] " << errorKindName(ErrorKind::SegmentText)
                  << " at segment " << index << ", skipped" << std::endl;
        emitError(sink_, "Text segment could not be converted to string.");
        return;
    }

    Segment segment;
    segment.startMs = state.segmentStart(index) * kEngineTimeScaleMs;
    segment.endMs = state.segmentEnd(index) * kEngineTimeScaleMs;
    segment.text = raw;

    try {
        store_.pushSegment(segment, sink_);
        ++accepted_;
    } catch (const TranscriptionError& e) {
        if (e.kind() != ErrorKind::StoreUnavailable) throw;
        ++rejected_;
        emitError(sink_, e.what());
    }
}
