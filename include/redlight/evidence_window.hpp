#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/types.hpp"

namespace redlight {

// Bounded retention of rendered frames keyed by frame index. Past capacity
// the smallest index is evicted, so clips near the start of the window can
// come back shorter than requested.
class EvidenceWindow {
public:
    struct Entry {
        cv::Mat frame;
        Timestamp timestamp;
    };

    explicit EvidenceWindow(std::size_t capacity);

    static std::size_t capacityFor(double fps, double seconds);

    void push(std::int64_t frame_index, const cv::Mat& frame, Timestamp timestamp);

    // Retained frames with index in [center - half, center + half], ascending.
    std::vector<cv::Mat> extractClip(std::int64_t center_frame_index, std::int64_t half_window_frames) const;
    std::vector<std::int64_t> clipIndices(std::int64_t center_frame_index, std::int64_t half_window_frames) const;

    std::optional<Timestamp> timestampOf(std::int64_t frame_index) const;
    bool contains(std::int64_t frame_index) const { return entries_.count(frame_index) != 0; }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }
    std::int64_t oldestIndex() const;
    std::int64_t newestIndex() const;

private:
    std::size_t capacity_;
    std::map<std::int64_t, Entry> entries_;
};

}  // namespace redlight
