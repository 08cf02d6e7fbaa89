#ifndef WHISPER_ENGINE_HPP
#define WHISPER_ENGINE_HPP

#include "stt/engine.hpp"

#include <memory>
#include <string>

struct whisper_context;

class WhisperEngine : public Engine {
public:
    struct Config {
        bool useGpu = false;
        bool flashAttn = false;
        bool verbose = false;  // forward whisper.cpp info logs
    };

    explicit WhisperEngine(Config config);

    std::unique_ptr<EngineSession> load(const std::string& modelPath) override;

private:
    Config config_;
};

class WhisperSession : public EngineSession {
public:
    WhisperSession(const std::string& modelPath, const WhisperEngine::Config& config);
    ~WhisperSession() override;

    WhisperSession(const WhisperSession&) = delete;
    WhisperSession& operator=(const WhisperSession&) = delete;

    std::unique_ptr<DecodeState> createState() override;

private:
    whisper_context* context_ = nullptr;
};

#endif
