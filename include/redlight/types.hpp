#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace redlight {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline constexpr const char* kUnknownPlate = "UNKNOWN";
inline constexpr const char* kViolationType = "Red_Light_Crossing";
inline constexpr std::size_t kMaxPlateLength = 10;

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
};

// Corner form, as produced by the tracker: x1, y1, x2, y2.
struct BoundingBox {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }

    // Bottom-centre: the point of the vehicle that reaches the stop line.
    Point anchor() const { return Point{(x1 + x2) / 2, y2}; }

    cv::Rect toRect() const { return cv::Rect(x1, y1, width(), height()); }
};

struct StopLine {
    Point start;
    Point end;

    // Non-horizontal lines are approximated by the mean y of both endpoints.
    double thresholdY() const { return (start.y + end.y) / 2.0; }
};

struct TrackedBox {
    int track_id = 0;
    BoundingBox box;
};

struct TrackObservation {
    int track_id = 0;
    std::int64_t frame_index = 0;
    Point centroid;
    BoundingBox box;
};

struct CrossingEvent {
    int track_id = 0;
    std::int64_t frame_index = 0;
    Point centroid;
    BoundingBox box;
    Timestamp timestamp;
    const cv::Mat* frame = nullptr;
};

struct ZoneFactors {
    bool is_school_zone = false;
};

struct ViolationRecord {
    std::string id;
    std::string vehicle_plate;
    double fine_amount = 0.0;
    std::string image_path;
    std::string video_clip_path;
    double ocr_confidence = 0.0;
    std::string location_id;
    std::string violation_type{kViolationType};
    int track_id = 0;
    std::int64_t frame_index = 0;
    Timestamp timestamp;
};

}  // namespace redlight
