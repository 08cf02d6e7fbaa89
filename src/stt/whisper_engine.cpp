#include "stt/whisper_engine.hpp"

#include "stt/callback_binding.hpp"
#include "stt/transcription_error.hpp"

#include <whisper.h>

#include <iostream>
#include <string>

namespace {

void logToConsole(ggml_log_level level, const char* text, bool verbose) {
    if (!text) return;
    if (level == GGML_LOG_LEVEL_ERROR) {
        std::cerr << "[Whisper] [ERROR] " << text;
    } else if (level == GGML_LOG_LEVEL_WARN) {
        std::cerr << "[Whisper] [WARN] " << text;
    } else if (verbose) {
        std::cout << "[Whisper] " << text;
    }
}

void logQuiet(ggml_log_level level, const char* text, void*) { logToConsole(level, text, false); }
void logVerbose(ggml_log_level level, const char* text, void*) { logToConsole(level, text, true); }

class WhisperDecodeState : public DecodeState {
public:
    WhisperDecodeState(whisper_context* context, whisper_state* state)
        : context_(context), state_(state) {}

    ~WhisperDecodeState() override {
        if (state_) whisper_free_state(state_);
    }

    WhisperDecodeState(const WhisperDecodeState&) = delete;
    WhisperDecodeState& operator=(const WhisperDecodeState&) = delete;

    void run(const DecodeParams& p, const std::vector<float>& samples,
             SegmentListener& listener) override {
        if (used_) {
            throw TranscriptionError(ErrorKind::Decode, "Decode state has already been used");
        }
        used_ = true;

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.greedy.best_of = p.bestOf;

        params.n_threads = p.threads;
        params.language = p.language.c_str();
        params.translate = p.translate;
        params.offset_ms = p.offsetMs;
        params.duration_ms = p.durationMs;
        params.tdrz_enable = p.tinydiarize;
        params.suppress_nst = p.suppressNonSpeech;

        params.print_progress = false;
        params.print_realtime = false;
        params.print_timestamps = false;

        CallbackBinding binding(*this, listener);

        params.new_segment_callback = segmentCallbackTrampoline;
        params.new_segment_callback_user_data = &binding;
        params.abort_callback = abortOnCallbackError;
        params.abort_callback_user_data = &binding;

        const int rc = whisper_full_with_state(context_, state_, params,
                                               samples.data(), (int)samples.size());
        binding.rethrowIfFailed();
        if (rc != 0) {
            throw TranscriptionError(ErrorKind::Decode,
                                     "Running the language model failed (whisper_full returned " +
                                     std::to_string(rc) + ")");
        }
    }

    int segmentCount() const override {
        return whisper_full_n_segments_from_state(state_);
    }

    const char* segmentText(int index) const override {
        return whisper_full_get_segment_text_from_state(state_, index);
    }

    int64_t segmentStart(int index) const override {
        return whisper_full_get_segment_t0_from_state(state_, index);
    }

    int64_t segmentEnd(int index) const override {
        return whisper_full_get_segment_t1_from_state(state_, index);
    }

private:
    whisper_context* context_;
    whisper_state* state_;
    bool used_ = false;
};

} // namespace

// Constructor
WhisperEngine::WhisperEngine(Config config) : config_(config) {
    whisper_log_set(config_.verbose ? logVerbose : logQuiet, nullptr);
}

std::unique_ptr<EngineSession> WhisperEngine::load(const std::string& modelPath) {
    return std::make_unique<WhisperSession>(modelPath, config_);
}

// Loads the model; the context lives as long as the session
WhisperSession::WhisperSession(const std::string& modelPath, const WhisperEngine::Config& config) {
    if (modelPath.empty()) {
        throw TranscriptionError(ErrorKind::ModelLoad, "No language model path was given");
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config.useGpu;
    cparams.flash_attn = config.flashAttn;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) {
        throw TranscriptionError(ErrorKind::ModelLoad, "Failed to load the language model: " + modelPath);
    }
}

// Destructor
WhisperSession::~WhisperSession() {
    if (context_) whisper_free(context_);
}

std::unique_ptr<DecodeState> WhisperSession::createState() {
    whisper_state* state = whisper_init_state(context_);
    if (!state) {
        throw TranscriptionError(ErrorKind::StateInit, "Failed to initialize the whisper decode state");
    }
    return std::make_unique<WhisperDecodeState>(context_, state);
}
