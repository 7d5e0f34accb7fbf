#include "redlight/annotator.hpp"

#include <algorithm>
#include <string>

#include <opencv2/imgproc.hpp>

namespace redlight {

namespace {

const cv::Scalar kGreen(0, 200, 0);
const cv::Scalar kRed(0, 0, 255);
const cv::Scalar kWhite(255, 255, 255);

}  // namespace

cv::Mat Annotator::render(const cv::Mat& frame,
                          const std::vector<TrackedBox>& tracks,
                          const StopLine& stop_line,
                          bool is_red,
                          const std::unordered_set<int>& flagged_tracks,
                          bool new_violation) const {
    cv::Mat canvas = frame.clone();
    if (canvas.empty()) {
        return canvas;
    }

    cv::line(canvas, cv::Point(stop_line.start.x, stop_line.start.y),
             cv::Point(stop_line.end.x, stop_line.end.y), is_red ? kRed : kGreen, 3);
    cv::putText(canvas, is_red ? "RED" : "GREEN", cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.9,
                is_red ? kRed : kGreen, 2);

    for (const auto& track : tracks) {
        const bool flagged = flagged_tracks.count(track.track_id) != 0;
        const cv::Scalar color = flagged ? kRed : kGreen;
        cv::rectangle(canvas, track.box.toRect(), color, 2);

        const Point anchor = track.box.anchor();
        cv::circle(canvas, cv::Point(anchor.x, anchor.y), 4, color, cv::FILLED);

        std::string label = "ID " + std::to_string(track.track_id);
        if (flagged) {
            label += " VIOLATION";
        }
        cv::putText(canvas, label, cv::Point(track.box.x1, std::max(15, track.box.y1 - 6)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 2);
    }

    if (new_violation) {
        const int height = std::min(40, canvas.rows);
        cv::rectangle(canvas, cv::Rect(0, canvas.rows - height, canvas.cols, height), kRed, cv::FILLED);
        cv::putText(canvas, "RED LIGHT VIOLATION", cv::Point(10, canvas.rows - 12),
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, kWhite, 2);
    }
    return canvas;
}

}  // namespace redlight
