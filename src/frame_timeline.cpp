#include "redlight/frame_timeline.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "redlight/common.hpp"

namespace redlight {

std::vector<SignalInterval> parseSignalIntervals(const JsonValue& document) {
    if (!document.isObject() || !document.contains("red_intervals") || !document.at("red_intervals").isArray()) {
        throw JsonError("signal document must contain a 'red_intervals' array");
    }

    std::vector<SignalInterval> intervals;
    for (const auto& entry : document.at("red_intervals").asArray()) {
        const auto start = parseIsoTimestamp(entry.getString("start"));
        const auto end = parseIsoTimestamp(entry.getString("end"));
        if (!start || !end) {
            throw JsonError("red interval needs ISO-8601 'start' and 'end' timestamps");
        }
        intervals.push_back(SignalInterval{*start, *end});
    }
    return intervals;
}

std::vector<SignalInterval> loadSignalIntervals(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    try {
        std::vector<SignalInterval> intervals = parseSignalIntervals(parseJsonFile(path));
        std::cout << "[Signal] Loaded " << intervals.size() << " red light intervals from " << path << std::endl;
        return intervals;
    } catch (const JsonError& ex) {
        std::cerr << "[Signal] Ignoring signal timestamps " << path << ": " << ex.what() << std::endl;
    }
    return {};
}

FrameTimeline::FrameTimeline(Timestamp start, double fps, std::vector<SignalInterval> red_intervals, bool force_red)
    : start_(start), fps_(fps), red_intervals_(std::move(red_intervals)), force_red_(force_red) {
    if (!(fps_ > 0.0) || !std::isfinite(fps_)) {
        throw std::invalid_argument("FrameTimeline needs a positive frame rate");
    }
}

Timestamp FrameTimeline::timestampAt(std::int64_t frame_index) const {
    const std::chrono::duration<double> offset(static_cast<double>(frame_index) / fps_);
    return start_ + std::chrono::duration_cast<Clock::duration>(offset);
}

bool FrameTimeline::isRed(Timestamp ts) const {
    if (force_red_) {
        return true;
    }
    for (const auto& interval : red_intervals_) {
        if (interval.contains(ts)) {
            return true;
        }
    }
    return false;
}

}  // namespace redlight
