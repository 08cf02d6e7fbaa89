#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "host/host_link.hpp"
#include "host/transcription_service.hpp"
#include "store/transcript_store.hpp"
#include "test_support.hpp"
#include "udp_client.hpp"

using testsupport::TempDir;
using testsupport::UdpClient;
using testsupport::writeWav;

namespace {

// Decodes one segment, then holds the run open until released
class HeldEngine : public Engine {
public:
    std::promise<void> entered;
    std::shared_future<void> release;

    class State : public DecodeState {
    public:
        explicit State(HeldEngine& owner) : owner_(owner) {}

        void run(const DecodeParams&, const std::vector<float>&, SegmentListener& listener) override {
            decoded_ = 1;
            listener.onNewSegment(*this);
            owner_.entered.set_value();
            owner_.release.wait();
        }
        int segmentCount() const override { return decoded_; }
        const char* segmentText(int) const override { return "first words"; }
        int64_t segmentStart(int) const override { return 0; }
        int64_t segmentEnd(int) const override { return 50; }

    private:
        HeldEngine& owner_;
        int decoded_ = 0;
    };

    class Session : public EngineSession {
    public:
        explicit Session(HeldEngine& owner) : owner_(owner) {}
        std::unique_ptr<DecodeState> createState() override { return std::make_unique<State>(owner_); }

    private:
        HeldEngine& owner_;
    };

    std::unique_ptr<EngineSession> load(const std::string&) override {
        return std::make_unique<Session>(*this);
    }
};

nlohmann::json receiveJson(UdpClient& client) {
    const std::string raw = client.receive();
    if (raw.empty()) return nlohmann::json();
    return nlohmann::json::parse(raw);
}

}  // namespace

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        wavPath = dir.file("speech.wav");
        writeWav(wavPath, std::vector<short>(1600, 1200));

        engine.release = gate.get_future().share();
        link = std::make_unique<HostLink>("127.0.0.1", 0,
            [this](const std::string& msg, const std::string& senderIp, uint16_t senderPort) {
                service->handleRequest(msg, senderIp, senderPort);
            });
        service = std::make_unique<TranscriptionService>(engine, store, *link, config);
        link->start();
        ASSERT_NE(link->boundPort(), 0);
    }

    void TearDown() override {
        if (!released) gate.set_value();
        service->shutdown();
        link->stop();
    }

    std::string request(const std::string& path) const {
        return nlohmann::json{{"audio_path", path}, {"model_path", "models/ggml-tiny.bin"}}.dump();
    }

    void releaseRun() {
        released = true;
        gate.set_value();
    }

    TempDir dir;
    std::string wavPath;
    ServiceConfig config;
    HeldEngine engine;
    std::promise<void> gate;
    bool released = false;
    TranscriptStore store;
    std::unique_ptr<TranscriptionService> service;
    std::unique_ptr<HostLink> link;
};

TEST_F(ServiceTest, SecondClientDuringRunGetsOnlyBusyReply) {
    UdpClient first;
    UdpClient second;

    ASSERT_TRUE(first.sendTo(link->boundPort(), request(wavPath)));
    EXPECT_EQ(receiveJson(first)["status"], "start");
    const auto data = receiveJson(first);
    EXPECT_EQ(data["status"], "data");
    EXPECT_EQ(data["message"], "first words");
    EXPECT_EQ(data["end"], 500);
    engine.entered.get_future().wait();
    EXPECT_TRUE(service->busy());

    ASSERT_TRUE(second.sendTo(link->boundPort(), request(dir.file("other.wav"))));
    const auto busy = receiveJson(second);
    EXPECT_EQ(busy["status"], "error");
    EXPECT_EQ(busy["message"], "A transcription is already running");

    // The running request's client keeps its events and sees no rejection
    Segment late;
    late.startMs = 500;
    late.endMs = 900;
    late.text = "still mine";
    ASSERT_TRUE(link->emit(EventPayload::data(late)));
    EXPECT_EQ(receiveJson(first)["message"], "still mine");

    second.setTimeout(200);
    EXPECT_TRUE(second.receive().empty());

    releaseRun();
    service->shutdown();
    EXPECT_EQ(store.audioPath(), wavPath);
    EXPECT_EQ(store.segmentCount(), 1u);
}

TEST_F(ServiceTest, ShutdownWaitsForTheRunningTranscription) {
    UdpClient client;
    ASSERT_TRUE(client.sendTo(link->boundPort(), request(wavPath)));
    engine.entered.get_future().wait();

    auto stopping = std::async(std::launch::async, [this] { service->shutdown(); });
    EXPECT_EQ(stopping.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    releaseRun();
    ASSERT_EQ(stopping.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    stopping.get();
    EXPECT_FALSE(service->busy());

    // New work is refused once shutdown has begun, but the link still answers
    UdpClient late;
    ASSERT_TRUE(late.sendTo(link->boundPort(), request(wavPath)));
    const auto reply = receiveJson(late);
    EXPECT_EQ(reply["status"], "error");
    EXPECT_EQ(reply["message"], "The service is shutting down");
}

TEST_F(ServiceTest, MalformedRequestIsAnsweredWithoutTakingOverEvents) {
    UdpClient client;
    ASSERT_TRUE(client.sendTo(link->boundPort(), "not json"));

    const auto reply = receiveJson(client);
    EXPECT_EQ(reply["status"], "error");
    EXPECT_FALSE(service->busy());
    EXPECT_FALSE(link->emit(EventPayload::start("nobody accepted")));
}
