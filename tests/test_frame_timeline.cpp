#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "redlight/common.hpp"
#include "redlight/frame_timeline.hpp"

using redlight::Clock;
using redlight::FrameTimeline;
using redlight::parseIsoTimestamp;
using redlight::SignalInterval;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path.string();
}

}  // namespace

TEST(IsoTimestamp, ParsesUtcAndOffsets) {
    const auto utc = parseIsoTimestamp("2024-01-01T00:00:00Z");
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(*utc, Clock::from_time_t(1704067200));

    const auto plus_two = parseIsoTimestamp("2024-01-01T02:00:00+02:00");
    ASSERT_TRUE(plus_two.has_value());
    EXPECT_EQ(*plus_two, *utc);

    const auto minus = parseIsoTimestamp("2023-12-31T19:00:00-05:00");
    ASSERT_TRUE(minus.has_value());
    EXPECT_EQ(*minus, *utc);
}

TEST(IsoTimestamp, ParsesFractionalSeconds) {
    const auto ts = parseIsoTimestamp("2024-01-01T00:00:00.5Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts - Clock::from_time_t(1704067200), std::chrono::milliseconds(500));
}

TEST(IsoTimestamp, NaiveTimestampsAreLocalTime) {
    const auto ts = parseIsoTimestamp("2024-06-15T08:30:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, redlight::makeLocalTimestamp(2024, 6, 15, 8, 30, 0));
}

TEST(IsoTimestamp, RejectsGarbage) {
    EXPECT_FALSE(parseIsoTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-13-01T00:00:00").has_value());
    EXPECT_FALSE(parseIsoTimestamp("").has_value());
}

TEST(IsoTimestamp, FormatsUtcWithMilliseconds) {
    const auto ts = Clock::from_time_t(1704067200) + std::chrono::milliseconds(7);
    EXPECT_EQ(redlight::formatIsoTimestamp(ts), "2024-01-01T00:00:00.007Z");
}

TEST(FrameTimeline, MapsFrameIndexThroughFrameRate) {
    const auto start = Clock::from_time_t(1704067200);
    FrameTimeline timeline(start, 30.0, {}, false);
    EXPECT_EQ(timeline.timestampAt(0), start);
    EXPECT_EQ(timeline.timestampAt(30), start + std::chrono::seconds(1));
    EXPECT_EQ(timeline.timestampAt(45), start + std::chrono::milliseconds(1500));
}

TEST(FrameTimeline, IntervalsAreInclusiveOnBothEnds) {
    const auto start = Clock::from_time_t(1704067200);
    FrameTimeline timeline(start, 10.0,
                           {SignalInterval{start + std::chrono::seconds(1), start + std::chrono::seconds(2)}},
                           false);
    EXPECT_FALSE(timeline.isRedAt(9));
    EXPECT_TRUE(timeline.isRedAt(10));
    EXPECT_TRUE(timeline.isRedAt(20));
    EXPECT_FALSE(timeline.isRedAt(21));
}

TEST(FrameTimeline, ForceRedOverridesIntervals) {
    FrameTimeline timeline(Clock::now(), 25.0, {}, true);
    EXPECT_TRUE(timeline.isRedAt(0));
    EXPECT_TRUE(timeline.isRedAt(100000));
}

TEST(FrameTimeline, RejectsNonPositiveFrameRate) {
    EXPECT_THROW(FrameTimeline(Clock::now(), 0.0, {}, false), std::invalid_argument);
}

TEST(SignalIntervals, LoadsDocument) {
    const auto path = writeTempFile("redlight_signal_ok.json",
                                    R"({"red_intervals": [
                                        {"start": "2024-01-01T00:00:00Z", "end": "2024-01-01T00:00:30Z"},
                                        {"start": "2024-01-01T00:01:00Z", "end": "2024-01-01T00:01:30.250Z"}]})");
    const auto intervals = redlight::loadSignalIntervals(path);
    ASSERT_EQ(intervals.size(), 2u);
    EXPECT_EQ(intervals[0].start, Clock::from_time_t(1704067200));
    EXPECT_EQ(intervals[1].end - intervals[1].start, std::chrono::milliseconds(30250));
    std::remove(path.c_str());
}

TEST(SignalIntervals, MalformedOrMissingInputMeansNeverRed) {
    const auto broken = writeTempFile("redlight_signal_broken.json", R"({"red_intervals": [{"start": 12}]})");
    EXPECT_TRUE(redlight::loadSignalIntervals(broken).empty());
    std::remove(broken.c_str());

    const auto not_json = writeTempFile("redlight_signal_garbage.json", "this is not json");
    EXPECT_TRUE(redlight::loadSignalIntervals(not_json).empty());
    std::remove(not_json.c_str());

    EXPECT_TRUE(redlight::loadSignalIntervals("/nonexistent/redlight/signal.json").empty());
    EXPECT_TRUE(redlight::loadSignalIntervals("").empty());
}
