#ifndef TRANSCRIPT_STORE_HPP
#define TRANSCRIPT_STORE_HPP

#include "stt/types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class EventSink;

// Holds the active request and the segments produced for it. Shared between
// the pipeline (reads before the run) and the segment bridge (writes during
// the run). Each call takes the lock for its own duration only.
//
// If an exception escapes while the lock is held the store is poisoned and
// every later call throws TranscriptionError(StoreUnavailable).
class TranscriptStore {
public:
    TranscriptStore() = default;

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    // Replaces the request and drops the segments of the previous run.
    void configure(const TranscriptionRequest& request);

    TranscriptionRequest snapshot() const;

    std::string audioPath() const;
    std::string modelPath() const;
    std::optional<std::string> language() const;
    bool translate() const;
    int offsetMs() const;
    int durationMs() const;

    // Appends the segment and notifies the sink under the same lock.
    void pushSegment(const Segment& segment, EventSink& sink);

    std::vector<Segment> segments() const;
    std::size_t segmentCount() const;

    bool poisoned() const;

private:
    std::unique_lock<std::mutex> acquire() const;

    mutable std::mutex mutex_;
    bool poisoned_ = false;

    TranscriptionRequest request_;
    std::vector<Segment> segments_;
};

#endif
