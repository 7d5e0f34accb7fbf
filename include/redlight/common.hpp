#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/types.hpp"

namespace redlight {

// Parses "x1,y1,x2,y2". Throws std::invalid_argument on anything else.
StopLine parseStopLine(const std::string& text);

// ISO-8601 "YYYY-MM-DD[T ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]".
// Without an offset the value is interpreted in local time.
std::optional<Timestamp> parseIsoTimestamp(const std::string& text);
std::string formatIsoTimestamp(Timestamp ts);
std::string formatCompactTimestamp(Timestamp ts);
int localHourOfDay(Timestamp ts);
Timestamp makeLocalTimestamp(int year, int month, int day, int hour, int minute, int second);

// Rounds to `digits` decimals, ties to even on the exact binary value.
double roundDecimal(double value, int digits);

std::string detectLocalMac();

// Clips the box to the image; returns an empty Mat when nothing is left.
cv::Mat extractROI(const cv::Mat& image, const BoundingBox& box);

struct PreprocessInfo {
    std::vector<float> input_tensor;
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
};

PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h);

float IoU(const cv::Rect2f& a, const cv::Rect2f& b);
std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold = 0.45f);

}  // namespace redlight
