#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace redlight {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // False at end of stream.
    virtual bool read(cv::Mat& frame) = 0;
    virtual double fps() const = 0;
    virtual cv::Size frameSize() const = 0;
};

// Video file or stream URL through cv::VideoCapture. Throws
// std::runtime_error when the source cannot be opened.
class VideoFrameSource : public FrameSource {
public:
    static constexpr double kDefaultFps = 30.0;

    explicit VideoFrameSource(const std::string& uri);

    bool read(cv::Mat& frame) override;
    double fps() const override { return fps_; }
    cv::Size frameSize() const override { return size_; }

private:
    cv::VideoCapture capture_;
    double fps_ = kDefaultFps;
    cv::Size size_;
};

}  // namespace redlight
