#include "stt/transcription_pipeline.hpp"

#include "audio/wav_loader.hpp"
#include "events/event_sink.hpp"
#include "store/transcript_store.hpp"
#include "stt/segment_bridge.hpp"
#include "stt/transcription_error.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace {

// Clears the session flag when the run leaves, however it leaves
class SessionRelease {
public:
    explicit SessionRelease(std::atomic<bool>& flag) : flag_(flag) {}
    ~SessionRelease() { flag_.store(false); }

    SessionRelease(const SessionRelease&) = delete;
    SessionRelease& operator=(const SessionRelease&) = delete;

private:
    std::atomic<bool>& flag_;
};

void validate(const TranscriptionRequest& request) {
    if (request.offsetMs < 0) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "offset_ms must not be negative");
    }
    if (request.durationMs < 0) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "duration_ms must not be negative");
    }
}

} // namespace

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Configured: return "configured";
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

// Constructor
TranscriptionPipeline::TranscriptionPipeline(Engine& engine, TranscriptStore& store,
                                             EventSink& sink, int threads)
    : engine_(engine), store_(store), sink_(sink), threads_(threads) {}

void TranscriptionPipeline::claimSession() {
    bool expected = false;
    if (!session_active_.compare_exchange_strong(expected, true)) {
        throw TranscriptionError(ErrorKind::SessionBusy, "A transcription is already running");
    }
}

void TranscriptionPipeline::run() {
    claimSession();
    SessionRelease release(session_active_);
    execute();
}

std::future<void> TranscriptionPipeline::runAsync() {
    claimSession();
    try {
        return std::async(std::launch::async, [this] {
            SessionRelease release(session_active_);
            execute();
        });
    } catch (...) {
        session_active_.store(false);
        throw;
    }
}

DecodeParams TranscriptionPipeline::makeParams(const TranscriptionRequest& request) const {
    DecodeParams params;
    params.language = request.language && !request.language->empty() ? *request.language
                                                                      : std::string(kDefaultLanguage);
    params.translate = request.translate;
    params.offsetMs = request.offsetMs;
    params.durationMs = request.durationMs;
    params.threads = threads_;
    return params;
}

void TranscriptionPipeline::execute() {
    state_ = RunState::Idle;
    try {
        // One snapshot feeds every parameter of this run
        const TranscriptionRequest request = store_.snapshot();
        validate(request);

        std::cout << "[Pipeline] Loading " << request.audioPath << std::endl;
        const WavAudio audio = loadWavPcm16(request.audioPath);

        std::cout << "[Pipeline] Loading model " << request.modelPath << std::endl;
        std::unique_ptr<EngineSession> session = engine_.load(request.modelPath);
        state_ = RunState::Configured;

        std::unique_ptr<DecodeState> decode = session->createState();

        bool started = false;
        try {
            started = sink_.emit(EventPayload::start("Initialization complete. Starting transcription."));
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] [ERROR] start event threw: " << e.what() << std::endl;
        }
        if (!started) {
            throw TranscriptionError(ErrorKind::EventEmission, "Failed to send the start event");
        }
        state_ = RunState::Running;

        SegmentBridge bridge(store_, sink_);
        decode->run(makeParams(request), audio.samples, bridge);

        state_ = RunState::Completed;
        std::cout << "[Pipeline] Done: " << bridge.accepted() << " segments, "
                  << bridge.rejected() << " skipped" << std::endl;
    } catch (const TranscriptionError& e) {
        state_ = RunState::Failed;
        std::cerr << "[Pipeline] [ERROR] " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        // The channel is already down; nothing more to tell the host
        if (e.kind() != ErrorKind::EventEmission) emitError(sink_, e.what());
        throw;
    } catch (const std::exception& e) {
        state_ = RunState::Failed;
        const std::string message = std::string("Running the language model failed: ") + e.what();
        std::cerr << "[Pipeline] [ERROR] " << message << std::endl;
        emitError(sink_, message);
        throw TranscriptionError(ErrorKind::Decode, message);
    }
}
