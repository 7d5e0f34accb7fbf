#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/config.hpp"
#include "redlight/types.hpp"

namespace redlight {

struct Detection {
    BoundingBox box;
    int class_id = -1;
    std::string label;
    float confidence = 0.0f;
};

// Reads the `names` entry of an Ultralytics data YAML, as a sequence or as
// an index-keyed map. Returns an empty list when the file has none.
std::vector<std::string> loadClassNames(const std::string& yaml_path);

// YOLOv8 detector (single [1, 4 + classes, N] output) restricted to the
// vehicle classes named in DetectorConfig::vehicle_labels.
class VehicleDetector {
public:
    explicit VehicleDetector(DetectorConfig config);
    ~VehicleDetector();

    bool load();
    void release();
    bool isLoaded() const noexcept { return loaded_; }

    std::vector<Detection> infer(const cv::Mat& image) const;

    bool isVehicle(int class_id, const std::string& label) const;
    const std::vector<std::string>& classNames() const { return class_names_; }

private:
    struct Impl;

    DetectorConfig config_;
    std::vector<std::string> class_names_;
    bool loaded_ = false;
    std::unique_ptr<Impl> impl_;
};

}  // namespace redlight
