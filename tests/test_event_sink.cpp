#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <sstream>

#include "events/event_sink.hpp"
#include "test_support.hpp"

TEST(EventPayload, DataEventCarriesSegmentBounds) {
    Segment s;
    s.startMs = 500;
    s.endMs = 1200;
    s.text = " \"quoted\" text";

    const auto j = nlohmann::json::parse(toJson(EventPayload::data(s)));

    EXPECT_EQ(j["event"], "whisper");
    EXPECT_EQ(j["status"], "data");
    EXPECT_EQ(j["message"], " \"quoted\" text");
    EXPECT_EQ(j["start"], 500);
    EXPECT_EQ(j["end"], 1200);
}

TEST(EventPayload, StartAndErrorHaveNoBounds) {
    const auto start = nlohmann::json::parse(toJson(EventPayload::start("go")));
    EXPECT_EQ(start["status"], "start");
    EXPECT_FALSE(start.contains("start"));

    const auto error = nlohmann::json::parse(toJson(EventPayload::error("bad model")));
    EXPECT_EQ(error["status"], "error");
    EXPECT_EQ(error["message"], "bad model");
}

TEST(ConsoleEventSink, WritesOneJsonLinePerEvent) {
    std::ostringstream out;
    ConsoleEventSink sink(out);

    EXPECT_TRUE(sink.emit(EventPayload::start("go")));
    EXPECT_TRUE(sink.emit(EventPayload::error("oops")));

    std::istringstream lines(out.str());
    std::string line;
    int n = 0;
    while (std::getline(lines, line)) {
        EXPECT_NO_THROW(nlohmann::json::parse(line));
        ++n;
    }
    EXPECT_EQ(n, 2);
}

TEST(EmitError, SwallowsChannelFailure) {
    testsupport::RecordingSink sink;
    sink.failAll = true;

    EXPECT_NO_THROW(emitError(sink, "already failing"));
    EXPECT_TRUE(sink.events().empty());
}
