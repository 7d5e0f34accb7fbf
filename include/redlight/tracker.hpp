#pragma once

#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/types.hpp"
#include "redlight/vehicle_detector.hpp"

namespace redlight {

// Produces (track id, box) pairs for a frame. Ids persist across frames for
// the same physical object.
class Tracker {
public:
    virtual ~Tracker() = default;
    virtual std::vector<TrackedBox> update(const cv::Mat& frame) = 0;
};

// Greedy IoU association: highest-overlap pairs are matched first, unmatched
// detections open new tracks, tracks unmatched for more than max_age frames
// are dropped. Ids start at 1 and are never reused.
class IouTracker {
public:
    explicit IouTracker(double iou_threshold = 0.3, int max_age = 30);

    std::vector<TrackedBox> update(const std::vector<BoundingBox>& detections);

    std::size_t activeTracks() const { return tracks_.size(); }

private:
    struct Track {
        int id;
        BoundingBox box;
        int missed;
    };

    double iou_threshold_;
    int max_age_;
    int next_id_ = 1;
    std::vector<Track> tracks_;
};

class YoloTracker : public Tracker {
public:
    YoloTracker(std::unique_ptr<VehicleDetector> detector, IouTracker tracker);

    std::vector<TrackedBox> update(const cv::Mat& frame) override;

private:
    std::unique_ptr<VehicleDetector> detector_;
    IouTracker tracker_;
};

}  // namespace redlight
