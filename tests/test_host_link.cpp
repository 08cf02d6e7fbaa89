#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <future>
#include <string>

#include "host/host_link.hpp"
#include "udp_client.hpp"

using testsupport::UdpClient;

TEST(HostLink, EmitWithoutClientFails) {
    HostLink link("127.0.0.1", 0, nullptr);
    EXPECT_FALSE(link.emit(EventPayload::start("nobody listening")));
}

TEST(HostLink, InvalidBindAddressThrows) {
    HostLink link("not-an-ip", 0, nullptr);
    EXPECT_THROW(link.start(), std::runtime_error);
}

TEST(HostLink, EmitAfterStopFails) {
    HostLink link("127.0.0.1", 0, nullptr);
    link.start();
    link.setActiveClient("127.0.0.1", 9);
    link.stop();

    EXPECT_EQ(link.boundPort(), 0);
    EXPECT_FALSE(link.emit(EventPayload::start("link is down")));
}

TEST(HostLink, RequestAloneDoesNotRedirectEvents) {
    std::promise<void> received;
    auto receivedFuture = received.get_future();

    HostLink link("127.0.0.1", 0,
        [&](const std::string&, const std::string&, uint16_t) { received.set_value(); });
    link.start();

    UdpClient client;
    ASSERT_TRUE(client.sendTo(link.boundPort(), R"({"audio_path":"a.wav"})"));
    ASSERT_EQ(receivedFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    // Only the request handler picks the event target
    EXPECT_FALSE(link.emit(EventPayload::start("not accepted")));
    link.stop();
}

TEST(HostLink, RequestReachesCallbackAndEventsGoToAcceptedSender) {
    std::promise<std::pair<std::string, uint16_t>> received;
    auto receivedFuture = received.get_future();

    HostLink link("127.0.0.1", 0,
        [&](const std::string& msg, const std::string& senderIp, uint16_t senderPort) {
            EXPECT_EQ(senderIp, "127.0.0.1");
            EXPECT_EQ(msg, R"({"audio_path":"a.wav"})");
            received.set_value({senderIp, senderPort});
        });
    link.start();
    ASSERT_NE(link.boundPort(), 0);

    UdpClient client;
    ASSERT_TRUE(client.sendTo(link.boundPort(), R"({"audio_path":"a.wav"})"));

    ASSERT_EQ(receivedFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    const auto sender = receivedFuture.get();
    link.setActiveClient(sender.first, sender.second);

    Segment s;
    s.startMs = 0;
    s.endMs = 500;
    s.text = "hello";
    ASSERT_TRUE(link.emit(EventPayload::data(s)));

    const auto j = nlohmann::json::parse(client.receive());
    EXPECT_EQ(j["status"], "data");
    EXPECT_EQ(j["message"], "hello");
    EXPECT_EQ(j["end"], 500);

    link.stop();
}
