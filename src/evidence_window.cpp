#include "redlight/evidence_window.hpp"

#include <cmath>
#include <stdexcept>

namespace redlight {

EvidenceWindow::EvidenceWindow(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EvidenceWindow capacity must be positive");
    }
}

std::size_t EvidenceWindow::capacityFor(double fps, double seconds) {
    const double frames = std::floor(fps * seconds);
    if (!(frames >= 1.0)) {
        return 1;
    }
    return static_cast<std::size_t>(frames);
}

void EvidenceWindow::push(std::int64_t frame_index, const cv::Mat& frame, Timestamp timestamp) {
    entries_[frame_index] = Entry{frame, timestamp};
    while (entries_.size() > capacity_) {
        entries_.erase(entries_.begin());
    }
}

std::vector<cv::Mat> EvidenceWindow::extractClip(std::int64_t center_frame_index, std::int64_t half_window_frames) const {
    std::vector<cv::Mat> clip;
    if (half_window_frames < 0) {
        return clip;
    }
    auto it = entries_.lower_bound(center_frame_index - half_window_frames);
    const auto last = entries_.upper_bound(center_frame_index + half_window_frames);
    for (; it != last; ++it) {
        clip.push_back(it->second.frame);
    }
    return clip;
}

std::vector<std::int64_t> EvidenceWindow::clipIndices(std::int64_t center_frame_index, std::int64_t half_window_frames) const {
    std::vector<std::int64_t> indices;
    if (half_window_frames < 0) {
        return indices;
    }
    auto it = entries_.lower_bound(center_frame_index - half_window_frames);
    const auto last = entries_.upper_bound(center_frame_index + half_window_frames);
    for (; it != last; ++it) {
        indices.push_back(it->first);
    }
    return indices;
}

std::optional<Timestamp> EvidenceWindow::timestampOf(std::int64_t frame_index) const {
    auto it = entries_.find(frame_index);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.timestamp;
}

std::int64_t EvidenceWindow::oldestIndex() const {
    if (entries_.empty()) {
        throw std::logic_error("EvidenceWindow is empty");
    }
    return entries_.begin()->first;
}

std::int64_t EvidenceWindow::newestIndex() const {
    if (entries_.empty()) {
        throw std::logic_error("EvidenceWindow is empty");
    }
    return entries_.rbegin()->first;
}

}  // namespace redlight
