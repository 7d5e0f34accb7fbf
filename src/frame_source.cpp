#include "redlight/frame_source.hpp"

#include <iostream>
#include <stdexcept>

namespace redlight {

VideoFrameSource::VideoFrameSource(const std::string& uri) {
    if (uri.empty()) {
        throw std::runtime_error("Video source path is empty");
    }
    if (!capture_.open(uri)) {
        throw std::runtime_error("Failed to open video source: " + uri);
    }
    const double reported = capture_.get(cv::CAP_PROP_FPS);
    if (reported > 0.0) {
        fps_ = reported;
    } else {
        std::cerr << "[Video] " << uri << " reports no frame rate, assuming " << kDefaultFps << std::endl;
    }
    size_ = cv::Size(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
                     static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)));
    std::cout << "[Video] Opened " << uri << " " << size_.width << "x" << size_.height << " @ " << fps_
              << " fps" << std::endl;
}

bool VideoFrameSource::read(cv::Mat& frame) {
    return capture_.read(frame) && !frame.empty();
}

}  // namespace redlight
