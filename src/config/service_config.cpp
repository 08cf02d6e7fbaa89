#include "config/service_config.hpp"

#include "stt/transcription_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

static std::string readAll(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::optional<ServiceConfig> loadServiceConfig(const std::string& path) {
    const std::string text = readAll(path);
    if (text.empty()) return std::nullopt;

    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    ServiceConfig cfg;
    try {
        cfg.bindIp = j.value("bind_ip", cfg.bindIp);
        cfg.port = j.value("port", cfg.port);
        cfg.modelPath = j.value("model_path", cfg.modelPath);
        cfg.language = j.value("language", cfg.language);
        cfg.threads = j.value("threads", cfg.threads);
        cfg.useGpu = j.value("use_gpu", cfg.useGpu);
        cfg.verbose = j.value("verbose", cfg.verbose);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    return cfg;
}

void applyEnvironment(ServiceConfig& config) {
    if (const char* model = std::getenv("WAVSCRIBE_MODEL")) {
        if (*model) config.modelPath = model;
    }
}

TranscriptionRequest parseRequest(const std::string& json, const ServiceConfig& defaults) {
    const nlohmann::json j = nlohmann::json::parse(json, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw TranscriptionError(ErrorKind::InvalidRequest, "Request is not a JSON object");
    }

    TranscriptionRequest request;
    try {
        request.audioPath = j.at("audio_path").get<std::string>();
        request.modelPath = j.value("model_path", defaults.modelPath);
        if (j.contains("language") && !j["language"].is_null()) {
            request.language = j["language"].get<std::string>();
        } else {
            request.language = defaults.language;
        }
        request.translate = j.value("translate", false);
        request.offsetMs = j.value("offset_ms", 0);
        request.durationMs = j.value("duration_ms", 0);
    } catch (const nlohmann::json::exception& e) {
        throw TranscriptionError(ErrorKind::InvalidRequest, std::string("Malformed request: ") + e.what());
    }
    return request;
}
