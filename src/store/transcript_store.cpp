#include "store/transcript_store.hpp"

#include "events/event_sink.hpp"
#include "stt/transcription_error.hpp"

#include <iostream>

std::unique_lock<std::mutex> TranscriptStore::acquire() const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (poisoned_) {
        throw TranscriptionError(ErrorKind::StoreUnavailable,
                                 "Transcript store is unavailable after a failed update");
    }
    return lock;
}

void TranscriptStore::configure(const TranscriptionRequest& request) {
    auto lock = acquire();
    request_ = request;
    segments_.clear();
}

TranscriptionRequest TranscriptStore::snapshot() const {
    auto lock = acquire();
    return request_;
}

std::string TranscriptStore::audioPath() const {
    auto lock = acquire();
    return request_.audioPath;
}

std::string TranscriptStore::modelPath() const {
    auto lock = acquire();
    return request_.modelPath;
}

std::optional<std::string> TranscriptStore::language() const {
    auto lock = acquire();
    return request_.language;
}

bool TranscriptStore::translate() const {
    auto lock = acquire();
    return request_.translate;
}

int TranscriptStore::offsetMs() const {
    auto lock = acquire();
    return request_.offsetMs;
}

int TranscriptStore::durationMs() const {
    auto lock = acquire();
    return request_.durationMs;
}

void TranscriptStore::pushSegment(const Segment& segment, EventSink& sink) {
    auto lock = acquire();
    segments_.push_back(segment);
    try {
        if (!sink.emit(EventPayload::data(segment))) {
            std::cerr << "[Store] [WARN] data event for segment " << segments_.size() - 1
                      << " could not be delivered" << std::endl;
        }
    } catch (...) {
        poisoned_ = true;
        throw;
    }
}

std::vector<Segment> TranscriptStore::segments() const {
    auto lock = acquire();
    return segments_;
}

std::size_t TranscriptStore::segmentCount() const {
    auto lock = acquire();
    return segments_.size();
}

bool TranscriptStore::poisoned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return poisoned_;
}
