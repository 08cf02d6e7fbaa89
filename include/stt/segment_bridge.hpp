#ifndef SEGMENT_BRIDGE_HPP
#define SEGMENT_BRIDGE_HPP

#include "stt/engine.hpp"

#include <cstddef>
#include <string>

class EventSink;
class TranscriptStore;

// Receives finalized segments from the engine during a run and hands them to
// the store, which notifies the sink. Both references are borrowed from the
// caller of the run and must outlive it.
class SegmentBridge : public SegmentListener {
public:
    SegmentBridge(TranscriptStore& store, EventSink& sink);

    void onNewSegment(const DecodeState& state) override;

    std::size_t accepted() const { return accepted_; }
    std::size_t rejected() const { return rejected_; }

private:
    TranscriptStore& store_;
    EventSink& sink_;

    std::size_t accepted_ = 0;
    std::size_t rejected_ = 0;
};

bool isValidUtf8(const std::string& bytes);

#endif
