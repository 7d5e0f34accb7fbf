#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>

#include "redlight/types.hpp"

namespace redlight {

enum class TrackPhase { NotSeen, Tracking, Logged };

const char* trackPhaseName(TrackPhase phase);

struct TrackSample {
    std::int64_t frame_index = 0;
    Point centroid;
};

struct TrackState {
    TrackPhase phase = TrackPhase::NotSeen;
    std::deque<TrackSample> history;
    std::int64_t last_seen = -1;
};

/**
 * Per-track stop-line edge detector.
 *
 * observe() appends to a short FIFO history per track; evaluate() reports a
 * crossing when the previous sample was at or before the line and the
 * current one is past it. The detector never decides on its own that a
 * track was already reported: the owner moves a track to Logged through
 * markLogged(), which succeeds exactly once per track id.
 */
class CrossingDetector {
public:
    static constexpr std::size_t kDefaultHistory = 5;

    explicit CrossingDetector(std::size_t max_history = kDefaultHistory);

    void observe(int track_id, std::int64_t frame_index, Point centroid);

    bool evaluate(int track_id, Point centroid, const StopLine& stop_line, bool is_red_light) const;

    // NotSeen/Tracking -> Logged. Returns false if the track was already Logged.
    bool markLogged(int track_id);

    TrackPhase phase(int track_id) const;
    std::size_t historySize(int track_id) const;
    const TrackState* state(int track_id) const;

    // Forgets the positions of tracks not observed for more than max_age
    // frames. Logged tracks keep their phase.
    std::size_t pruneStale(std::int64_t current_frame, std::int64_t max_age);

    std::size_t trackCount() const { return tracks_.size(); }

private:
    std::size_t max_history_;
    std::unordered_map<int, TrackState> tracks_;
};

}  // namespace redlight
