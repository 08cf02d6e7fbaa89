#include "host/transcription_service.hpp"

#include "events/event_sink.hpp"
#include "host/host_link.hpp"
#include "store/transcript_store.hpp"
#include "stt/transcription_error.hpp"

#include <iostream>
#include <utility>

// Constructor
TranscriptionService::TranscriptionService(Engine& engine, TranscriptStore& store, HostLink& link,
                                           const ServiceConfig& config)
    : store_(store),
      link_(link),
      config_(config),
      pipeline_(engine, store, link, config.threads) {}

void TranscriptionService::reject(const std::string& senderIp, uint16_t senderPort, const std::string& reason) {
    if (!link_.sendTo(senderIp, senderPort, toJson(EventPayload::error(reason)))) {
        std::cerr << "[Service] [WARN] could not reply to " << senderIp << ":" << senderPort << std::endl;
    }
}

// Caller holds mutex_
void TranscriptionService::settlePrevious() {
    if (!current_.valid()) return;
    try {
        current_.get();
    } catch (const std::exception& e) {
        std::cout << "[Service] previous run ended with: " << e.what() << std::endl;
    }
}

void TranscriptionService::handleRequest(const std::string& msg, const std::string& senderIp, uint16_t senderPort) {
    std::cout << "[Service] request from " << senderIp << ":" << senderPort << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        reject(senderIp, senderPort, "The service is shutting down");
        return;
    }
    if (pipeline_.active()) {
        std::cout << "[Service] [WARN] transcription still running, request rejected" << std::endl;
        reject(senderIp, senderPort, "A transcription is already running");
        return;
    }

    settlePrevious();

    try {
        store_.configure(parseRequest(msg, config_));
        link_.setActiveClient(senderIp, senderPort);
        current_ = pipeline_.runAsync();
    } catch (const TranscriptionError& e) {
        std::cerr << "[Service] [ERROR] " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        reject(senderIp, senderPort, e.what());
    }
}

void TranscriptionService::shutdown() {
    std::future<void> last;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        last = std::move(current_);
    }

    if (!last.valid()) return;
    try {
        last.get();
    } catch (const std::exception& e) {
        std::cout << "[Service] last run ended with: " << e.what() << std::endl;
    }
}
