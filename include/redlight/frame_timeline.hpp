#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "redlight/json.hpp"
#include "redlight/types.hpp"

namespace redlight {

struct SignalInterval {
    Timestamp start;
    Timestamp end;

    // Both ends inclusive.
    bool contains(Timestamp ts) const { return start <= ts && ts <= end; }
};

// Reads {"red_intervals": [{"start": ISO-8601, "end": ISO-8601}, ...]}.
// Missing or malformed documents yield an empty set and a warning; they never throw.
std::vector<SignalInterval> loadSignalIntervals(const std::string& path);
std::vector<SignalInterval> parseSignalIntervals(const JsonValue& document);

class FrameTimeline {
public:
    FrameTimeline(Timestamp start, double fps, std::vector<SignalInterval> red_intervals, bool force_red);

    Timestamp timestampAt(std::int64_t frame_index) const;
    bool isRed(Timestamp ts) const;
    bool isRedAt(std::int64_t frame_index) const { return isRed(timestampAt(frame_index)); }

    double fps() const { return fps_; }
    Timestamp start() const { return start_; }
    bool forceRed() const { return force_red_; }
    const std::vector<SignalInterval>& intervals() const { return red_intervals_; }

private:
    Timestamp start_;
    double fps_;
    std::vector<SignalInterval> red_intervals_;
    bool force_red_;
};

}  // namespace redlight
