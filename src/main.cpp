#include "config/service_config.hpp"
#include "events/event_sink.hpp"
#include "host/host_link.hpp"
#include "host/transcription_service.hpp"
#include "store/transcript_store.hpp"
#include "stt/transcription_error.hpp"
#include "stt/transcription_pipeline.hpp"
#include "stt/whisper_engine.hpp"

#include <memory>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout <<
        "usage: wavscribe <audio.wav> [model.bin] [options]\n"
        "       wavscribe --serve [config.json]\n"
        "\n"
        "options:\n"
        "  --config FILE      service config (JSON)\n"
        "  --lang LANG        spoken language (default: ja)\n"
        "  --translate        translate to English\n"
        "  --offset-ms N      start offset in milliseconds\n"
        "  --duration-ms N    length to transcribe in milliseconds (0 = all)\n"
        "  --threads N        decoder threads\n";
}

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        const int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw TranscriptionError(ErrorKind::InvalidRequest, flag + " expects an integer, got '" + value + "'");
    }
}

ServiceConfig loadConfigOrDefault(const std::string& path) {
    ServiceConfig config;
    if (!path.empty()) {
        auto loaded = loadServiceConfig(path);
        if (!loaded) {
            throw TranscriptionError(ErrorKind::InvalidRequest, "Could not read config file: " + path);
        }
        config = *loaded;
    }
    applyEnvironment(config);
    return config;
}

WhisperEngine::Config engineConfig(const ServiceConfig& config) {
    WhisperEngine::Config ec;
    ec.useGpu = config.useGpu;
    ec.verbose = config.verbose;
    return ec;
}

int runOnce(const std::vector<std::string>& args) {
    std::string configPath;
    std::vector<std::string> positional;
    TranscriptionRequest request;
    std::optional<int> threads;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw TranscriptionError(ErrorKind::InvalidRequest, a + " needs a value");
            }
            return args[++i];
        };

        if (a == "--config") configPath = next();
        else if (a == "--lang") request.language = next();
        else if (a == "--translate") request.translate = true;
        else if (a == "--offset-ms") request.offsetMs = parseInt(a, next());
        else if (a == "--duration-ms") request.durationMs = parseInt(a, next());
        else if (a == "--threads") threads = parseInt(a, next());
        else if (!a.empty() && a[0] == '-') {
            throw TranscriptionError(ErrorKind::InvalidRequest, "Unknown option: " + a);
        } else positional.push_back(a);
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage();
        return 2;
    }

    const ServiceConfig config = loadConfigOrDefault(configPath);
    request.audioPath = positional[0];
    request.modelPath = positional.size() > 1 ? positional[1] : config.modelPath;
    if (!request.language) request.language = config.language;

    WhisperEngine engine(engineConfig(config));
    TranscriptStore store;
    ConsoleEventSink sink(std::cout);
    TranscriptionPipeline pipeline(engine, store, sink, threads.value_or(config.threads));

    store.configure(request);
    pipeline.run();
    return 0;
}

int serve(const std::string& configPath) {
    const ServiceConfig config = loadConfigOrDefault(configPath);

    WhisperEngine engine(engineConfig(config));
    TranscriptStore store;

    // The link is the event sink of every run the service starts
    std::unique_ptr<TranscriptionService> service;
    HostLink link(config.bindIp, config.port,
        [&](const std::string& msg, const std::string& senderIp, uint16_t senderPort) {
            service->handleRequest(msg, senderIp, senderPort);
        });
    service = std::make_unique<TranscriptionService>(engine, store, link, config);

    link.start();

    std::string line;
    std::cout << "\nwavscribe listening on " << config.bindIp << ":" << config.port
              << "... Press enter to quit." << std::endl;
    std::getline(std::cin, line);

    service->shutdown();
    link.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        printUsage();
        return args.empty() ? 2 : 0;
    }

    try {
        if (args[0] == "--serve") {
            return serve(args.size() > 1 ? args[1] : std::string());
        }
        return runOnce(args);
    } catch (const TranscriptionError& e) {
        std::cerr << "[wavscribe] [ERROR] " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[wavscribe] [ERROR] " << e.what() << std::endl;
        return 1;
    }
}
