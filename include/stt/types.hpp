#ifndef STT_TYPES_HPP
#define STT_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

// Language used when a request does not name one
inline constexpr const char* kDefaultLanguage = "ja";

struct TranscriptionRequest {
    std::string audioPath;
    std::string modelPath;
    std::optional<std::string> language;
    bool translate = false;
    int offsetMs = 0;
    int durationMs = 0;  // 0 = until the end of the audio
};

// One finalized span of recognized speech. Times are milliseconds from the
// start of the audio.
struct Segment {
    int64_t startMs = 0;
    int64_t endMs = 0;
    std::string text;
};

#endif
