#pragma once

#include <unordered_set>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/types.hpp"

namespace redlight {

// Draws onto a copy of the frame: the stop line (red or green with the
// signal), one box per track labelled with its id, flagged tracks in red,
// and a banner on frames that produced a violation.
class Annotator {
public:
    cv::Mat render(const cv::Mat& frame,
                   const std::vector<TrackedBox>& tracks,
                   const StopLine& stop_line,
                   bool is_red,
                   const std::unordered_set<int>& flagged_tracks,
                   bool new_violation) const;
};

}  // namespace redlight
