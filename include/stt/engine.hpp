#ifndef STT_ENGINE_HPP
#define STT_ENGINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Engine timestamps are in 10 ms ticks. Defined by the engine ABI.
inline constexpr int64_t kEngineTimeScaleMs = 10;

struct DecodeParams {
    std::string language;
    bool translate = false;
    int offsetMs = 0;
    int durationMs = 0;
    int threads = 4;

    // Fixed for every run: greedy, best of 1
    int bestOf = 1;
    bool tinydiarize = true;
    bool suppressNonSpeech = true;
};

class DecodeState;

// Called by DecodeState::run() on the decoding thread, once per finalized
// segment, strictly before run() returns.
class SegmentListener {
public:
    virtual ~SegmentListener() = default;
    virtual void onNewSegment(const DecodeState& state) = 0;
};

// Mutable per-run decode state. run() may be called once.
class DecodeState {
public:
    virtual ~DecodeState() = default;

    // Blocks until the whole buffer is decoded.
    // Throws TranscriptionError(Decode) if the engine fails.
    virtual void run(const DecodeParams& params, const std::vector<float>& samples,
                     SegmentListener& listener) = 0;

    virtual int segmentCount() const = 0;

    // Raw engine bytes, may be null or not UTF-8
    virtual const char* segmentText(int index) const = 0;

    // Engine ticks, see kEngineTimeScaleMs
    virtual int64_t segmentStart(int index) const = 0;
    virtual int64_t segmentEnd(int index) const = 0;
};

// Loaded model.
class EngineSession {
public:
    virtual ~EngineSession() = default;

    // The session must outlive the returned state.
    // Throws TranscriptionError(StateInit)
    virtual std::unique_ptr<DecodeState> createState() = 0;
};

class Engine {
public:
    virtual ~Engine() = default;

    // Throws TranscriptionError(ModelLoad)
    virtual std::unique_ptr<EngineSession> load(const std::string& modelPath) = 0;
};

#endif
