#ifndef TRANSCRIPTION_SERVICE_HPP
#define TRANSCRIPTION_SERVICE_HPP

#include "config/service_config.hpp"
#include "stt/transcription_pipeline.hpp"

#include <cstdint>
#include <future>
#include <mutex>
#include <string>

class HostLink;
class TranscriptStore;

// Request handling for --serve mode. Accepted requests become the link's
// active client for the whole run; rejected senders get their error reply
// directly and never see another client's events.
class TranscriptionService {
public:
    TranscriptionService(Engine& engine, TranscriptStore& store, HostLink& link, const ServiceConfig& config);

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    // HostLink callback
    void handleRequest(const std::string& msg, const std::string& senderIp, uint16_t senderPort);

    // Refuses new requests and waits for the running transcription. Call
    // before stopping the link so the last events still go out.
    void shutdown();

    bool busy() const { return pipeline_.active(); }

private:
    void reject(const std::string& senderIp, uint16_t senderPort, const std::string& reason);
    void settlePrevious();

    TranscriptStore& store_;
    HostLink& link_;
    ServiceConfig config_;
    TranscriptionPipeline pipeline_;

    std::mutex mutex_;
    bool stopping_ = false;
    std::future<void> current_;
};

#endif
