#include "redlight/tracker.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "redlight/common.hpp"

namespace redlight {

namespace {

cv::Rect2f toRect2f(const BoundingBox& box) {
    return cv::Rect2f(static_cast<float>(box.x1), static_cast<float>(box.y1),
                      static_cast<float>(box.width()), static_cast<float>(box.height()));
}

}  // namespace

IouTracker::IouTracker(double iou_threshold, int max_age)
    : iou_threshold_(iou_threshold), max_age_(max_age) {
    if (max_age_ < 0) {
        throw std::invalid_argument("IouTracker max_age must not be negative");
    }
}

std::vector<TrackedBox> IouTracker::update(const std::vector<BoundingBox>& detections) {
    std::vector<std::tuple<float, std::size_t, std::size_t>> pairs;
    for (std::size_t t = 0; t < tracks_.size(); ++t) {
        for (std::size_t d = 0; d < detections.size(); ++d) {
            const float overlap = IoU(toRect2f(tracks_[t].box), toRect2f(detections[d]));
            if (overlap >= iou_threshold_) {
                pairs.emplace_back(overlap, t, d);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end(),
              [](const auto& a, const auto& b) { return std::get<0>(a) > std::get<0>(b); });

    std::vector<bool> track_used(tracks_.size(), false);
    std::vector<bool> det_used(detections.size(), false);
    std::vector<TrackedBox> result;

    for (const auto& [overlap, t, d] : pairs) {
        if (track_used[t] || det_used[d]) {
            continue;
        }
        track_used[t] = true;
        det_used[d] = true;
        tracks_[t].box = detections[d];
        tracks_[t].missed = 0;
        result.push_back(TrackedBox{tracks_[t].id, detections[d]});
    }

    for (std::size_t t = 0; t < tracks_.size(); ++t) {
        if (!track_used[t]) {
            ++tracks_[t].missed;
        }
    }
    tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                                 [this](const Track& track) { return track.missed > max_age_; }),
                  tracks_.end());

    for (std::size_t d = 0; d < detections.size(); ++d) {
        if (det_used[d]) {
            continue;
        }
        tracks_.push_back(Track{next_id_, detections[d], 0});
        result.push_back(TrackedBox{next_id_, detections[d]});
        ++next_id_;
    }
    return result;
}

YoloTracker::YoloTracker(std::unique_ptr<VehicleDetector> detector, IouTracker tracker)
    : detector_(std::move(detector)), tracker_(std::move(tracker)) {
    if (!detector_) {
        throw std::invalid_argument("YoloTracker requires a detector");
    }
}

std::vector<TrackedBox> YoloTracker::update(const cv::Mat& frame) {
    std::vector<BoundingBox> boxes;
    for (const auto& detection : detector_->infer(frame)) {
        boxes.push_back(detection.box);
    }
    return tracker_.update(boxes);
}

}  // namespace redlight
