#include "redlight/crossing_detector.hpp"

#include <stdexcept>

namespace redlight {

const char* trackPhaseName(TrackPhase phase) {
    switch (phase) {
        case TrackPhase::Tracking: return "TRACKING";
        case TrackPhase::Logged: return "LOGGED";
        default: return "NOT_SEEN";
    }
}

CrossingDetector::CrossingDetector(std::size_t max_history) : max_history_(max_history) {
    if (max_history_ < 2) {
        throw std::invalid_argument("CrossingDetector needs a history of at least two samples");
    }
}

void CrossingDetector::observe(int track_id, std::int64_t frame_index, Point centroid) {
    TrackState& state = tracks_[track_id];
    if (state.phase == TrackPhase::NotSeen) {
        state.phase = TrackPhase::Tracking;
    }
    state.history.push_back(TrackSample{frame_index, centroid});
    while (state.history.size() > max_history_) {
        state.history.pop_front();
    }
    state.last_seen = frame_index;
}

bool CrossingDetector::evaluate(int track_id, Point centroid, const StopLine& stop_line, bool is_red_light) const {
    if (!is_red_light) {
        return false;
    }
    auto it = tracks_.find(track_id);
    if (it == tracks_.end() || it->second.history.size() < 2) {
        return false;
    }

    const auto& history = it->second.history;
    const Point& previous = history[history.size() - 2].centroid;
    const double threshold = stop_line.thresholdY();

    // y grows towards the intersection: the line is inclusive on the approach side.
    const bool was_before_or_on = previous.y <= threshold;
    const bool crossed_past_line = centroid.y > threshold;
    return was_before_or_on && crossed_past_line;
}

bool CrossingDetector::markLogged(int track_id) {
    TrackState& state = tracks_[track_id];
    if (state.phase == TrackPhase::Logged) {
        return false;
    }
    state.phase = TrackPhase::Logged;
    return true;
}

TrackPhase CrossingDetector::phase(int track_id) const {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? TrackPhase::NotSeen : it->second.phase;
}

std::size_t CrossingDetector::historySize(int track_id) const {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? 0 : it->second.history.size();
}

const TrackState* CrossingDetector::state(int track_id) const {
    auto it = tracks_.find(track_id);
    return it == tracks_.end() ? nullptr : &it->second;
}

std::size_t CrossingDetector::pruneStale(std::int64_t current_frame, std::int64_t max_age) {
    std::size_t pruned = 0;
    for (auto it = tracks_.begin(); it != tracks_.end();) {
        TrackState& state = it->second;
        if (state.history.empty() || current_frame - state.last_seen <= max_age) {
            ++it;
            continue;
        }
        ++pruned;
        if (state.phase == TrackPhase::Logged) {
            state.history.clear();
            ++it;
        } else {
            it = tracks_.erase(it);
        }
    }
    return pruned;
}

}  // namespace redlight
