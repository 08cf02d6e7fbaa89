#ifndef WAV_LOADER_HPP
#define WAV_LOADER_HPP

#include <string>
#include <vector>

struct WavAudio {
    int sampleRate = 0;
    int channels = 0;
    std::vector<float> samples;  // interleaved, normalized to [-1, 1]
};

// Reads a 16-bit signed PCM WAV file.
// Throws TranscriptionError(AudioOpen) if the file cannot be opened or is not
// a WAV container, TranscriptionError(AudioDecode) if the encoding is not
// PCM16 or the sample data is shorter than the header says.
WavAudio loadWavPcm16(const std::string& path);

// Integer sample -> amplitude, dividing by the largest positive int16.
float pcm16ToFloat(short sample);

#endif
