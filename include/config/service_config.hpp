#ifndef SERVICE_CONFIG_HPP
#define SERVICE_CONFIG_HPP

#include "stt/types.hpp"

#include <optional>
#include <string>

struct ServiceConfig {
    std::string bindIp = "127.0.0.1";
    int port = 3940;

    std::string modelPath = "models/whisper/ggml-base.bin";
    std::string language = kDefaultLanguage;
    int threads = 4;

    bool useGpu = false;
    bool verbose = false;
};

// Missing keys keep their defaults. Returns nullopt if the file cannot be
// read or is not a JSON object.
std::optional<ServiceConfig> loadServiceConfig(const std::string& path);

// WAVSCRIBE_MODEL overrides the model path when set
void applyEnvironment(ServiceConfig& config);

// Parses a request datagram. Missing model_path / language fall back to the
// service defaults. Throws TranscriptionError(InvalidRequest).
TranscriptionRequest parseRequest(const std::string& json, const ServiceConfig& defaults);

#endif
