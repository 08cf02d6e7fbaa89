#include "audio/wav_loader.hpp"

#include "stt/transcription_error.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct SndFileCloser {
    void operator()(SNDFILE* f) const { if (f) sf_close(f); }
};

using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

// libsndfile shortens a data chunk that runs past the end of the file and
// only records it in the header log as "data : <declared> (should be <n>)".
bool dataChunkTruncated(SNDFILE* file) {
    char log[4096] = {};
    sf_command(file, SFC_GET_LOG_INFO, log, sizeof(log));

    std::istringstream lines(log);
    std::string line;
    while (std::getline(lines, line)) {
        const auto start = line.find_first_not_of(' ');
        if (start == std::string::npos) continue;
        if (line.compare(start, 7, "data : ") == 0 && line.find("(should be") != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

float pcm16ToFloat(short sample) {
    const float v = static_cast<float>(sample) / static_cast<float>(std::numeric_limits<int16_t>::max());
    // -32768 would land just below -1.0
    return std::max(v, -1.0f);
}

WavAudio loadWavPcm16(const std::string& path) {
    SF_INFO info{};
    SndFilePtr file(sf_open(path.c_str(), SFM_READ, &info));
    if (!file) {
        throw TranscriptionError(ErrorKind::AudioOpen,
                                 "Could not open the WAV file: " + path + " (" + sf_strerror(nullptr) + ")");
    }

    const int container = info.format & SF_FORMAT_TYPEMASK;
    if (container != SF_FORMAT_WAV && container != SF_FORMAT_WAVEX) {
        throw TranscriptionError(ErrorKind::AudioOpen, "Not a WAV file: " + path);
    }
    if ((info.format & SF_FORMAT_SUBMASK) != SF_FORMAT_PCM_16) {
        throw TranscriptionError(ErrorKind::AudioDecode,
                                 "Unsupported sample encoding (16-bit signed PCM required): " + path);
    }
    if (info.channels <= 0) {
        throw TranscriptionError(ErrorKind::AudioDecode, "Invalid channel count in " + path);
    }

    if (dataChunkTruncated(file.get())) {
        throw TranscriptionError(ErrorKind::AudioDecode,
                                 "WAV data is shorter than its header declares: " + path);
    }

    const sf_count_t expected = info.frames * info.channels;
    std::vector<short> pcm(static_cast<size_t>(expected));
    const sf_count_t got = expected > 0 ? sf_read_short(file.get(), pcm.data(), expected) : 0;
    if (got != expected) {
        throw TranscriptionError(ErrorKind::AudioDecode,
                                 "Failed to read samples from WAV file: " + path +
                                 " (read " + std::to_string(got) + " of " + std::to_string(expected) + ")");
    }

    WavAudio audio;
    audio.sampleRate = info.samplerate;
    audio.channels = info.channels;
    audio.samples.resize(pcm.size());
    std::transform(pcm.begin(), pcm.end(), audio.samples.begin(), pcm16ToFloat);

    if (audio.sampleRate != 16000) {
        std::cout << "[Audio] [WARN] " << path << " is " << audio.sampleRate
                  << " Hz; the engine expects 16000 Hz" << std::endl;
    }
    return audio;
}
