#ifndef TRANSCRIPTION_PIPELINE_HPP
#define TRANSCRIPTION_PIPELINE_HPP

#include "stt/engine.hpp"
#include "stt/types.hpp"

#include <atomic>
#include <future>

class EventSink;
class TranscriptStore;

enum class RunState { Idle, Configured, Running, Completed, Failed };

const char* runStateName(RunState state);

// Runs one transcription at a time over the request currently held by the
// store. Segments reach the store and the sink while the engine decodes.
//
// Every failure is thrown as TranscriptionError. Except for a failed start
// event, it is also reported to the sink as an error event first.
class TranscriptionPipeline {
public:
    TranscriptionPipeline(Engine& engine, TranscriptStore& store, EventSink& sink, int threads = 4);

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    // Blocks for the whole decode.
    void run();

    // Same work on a dedicated thread. SessionBusy is thrown here, before
    // the thread starts; everything else surfaces from future.get().
    std::future<void> runAsync();

    RunState state() const { return state_.load(); }
    bool active() const { return session_active_.load(); }

private:
    void claimSession();
    void execute();

    DecodeParams makeParams(const TranscriptionRequest& request) const;

    Engine& engine_;
    TranscriptStore& store_;
    EventSink& sink_;
    int threads_;

    std::atomic<bool> session_active_{false};
    std::atomic<RunState> state_{RunState::Idle};
};

#endif
