#include "redlight/vehicle_detector.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "redlight/common.hpp"

#ifdef REDLIGHT_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace redlight {

namespace {

// car, motorcycle, bus, truck in the COCO label set.
constexpr std::array<int, 4> kCocoVehicleIds{2, 3, 5, 7};

}  // namespace

std::vector<std::string> loadClassNames(const std::string& yaml_path) {
    std::vector<std::string> names;
    try {
        YAML::Node data = YAML::LoadFile(yaml_path);
        YAML::Node node = data["names"];
        if (!node) {
            std::cerr << "[VehicleDetector] 'names' not found in " << yaml_path << std::endl;
            return names;
        }
        if (node.IsSequence()) {
            for (const auto& name : node) {
                names.push_back(name.as<std::string>());
            }
        } else if (node.IsMap()) {
            for (const auto& kv : node) {
                const auto index = kv.first.as<std::size_t>();
                if (names.size() <= index) {
                    names.resize(index + 1);
                }
                names[index] = kv.second.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "[VehicleDetector] Failed to parse " << yaml_path << ": " << e.what() << std::endl;
        names.clear();
    }
    return names;
}

struct VehicleDetector::Impl {
#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "redlight") {
        session_options.SetIntraOpNumThreads(1);
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char*> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char*> output_name_ptrs;
#endif
    std::vector<int64_t> input_shape{1, 3, 640, 640};
};

VehicleDetector::VehicleDetector(DetectorConfig config) : config_(std::move(config)) {}

VehicleDetector::~VehicleDetector() = default;

bool VehicleDetector::load() {
    const std::string& model_path = config_.model_path;
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("YOLO model file not found: " + model_path);
    }
    if (!config_.names_path.empty()) {
        class_names_ = loadClassNames(config_.names_path);
    }
    if (class_names_.empty()) {
        std::cerr << "[VehicleDetector] No class names, falling back to COCO vehicle ids" << std::endl;
    }

    impl_ = std::make_unique<Impl>();

#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), impl_->session_options);

    impl_->input_names = impl_->session->GetInputNames();
    for (const auto& name : impl_->input_names) {
        impl_->input_name_ptrs.push_back(name.c_str());
    }
    impl_->output_names = impl_->session->GetOutputNames();
    for (const auto& name : impl_->output_names) {
        impl_->output_name_ptrs.push_back(name.c_str());
    }

    if (impl_->session->GetInputCount() > 0) {
        impl_->input_shape = impl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        for (auto& dim : impl_->input_shape) {
            if (dim <= 0) {
                dim = 640;
            }
        }
        impl_->input_shape[0] = 1;
    }
#else
    impl_.reset();
    throw std::runtime_error("ONNXRuntime backend is not available");
#endif

    std::cout << "[VehicleDetector] Loaded " << model_path << std::endl;
    loaded_ = true;
    return loaded_;
}

void VehicleDetector::release() {
    impl_.reset();
    loaded_ = false;
}

bool VehicleDetector::isVehicle(int class_id, const std::string& label) const {
    if (class_names_.empty()) {
        return std::find(kCocoVehicleIds.begin(), kCocoVehicleIds.end(), class_id) != kCocoVehicleIds.end();
    }
    return std::find(config_.vehicle_labels.begin(), config_.vehicle_labels.end(), label) !=
           config_.vehicle_labels.end();
}

std::vector<Detection> VehicleDetector::infer(const cv::Mat& image) const {
    std::vector<Detection> detections;
    if (!loaded_ || image.empty()) {
        return detections;
    }

#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    if (impl_->input_shape.size() < 4) {
        return detections;
    }
    const int input_h = static_cast<int>(impl_->input_shape[2]);
    const int input_w = static_cast<int>(impl_->input_shape[3]);

    PreprocessInfo prep = preprocessLetterbox(image, input_w, input_h);

    std::array<int64_t, 4> input_shape{1, 3, input_h, input_w};
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, prep.input_tensor.data(), prep.input_tensor.size(),
        input_shape.data(), input_shape.size());

    auto outputs = impl_->session->Run(
        Ort::RunOptions{},
        impl_->input_name_ptrs.data(), &input_tensor, 1,
        impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());

    if (outputs.empty() || !outputs.front().IsTensor()) {
        return detections;
    }
    std::vector<int64_t> shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3 || shape[0] != 1) {
        return detections;
    }

    const int C = static_cast<int>(shape[1]);
    const int N = static_cast<int>(shape[2]);
    const int num_classes = C - 4;
    const float* data = outputs.front().GetTensorData<float>();
    auto get_at = [&](int attr_idx, int i_box) -> float {
        return data[attr_idx * N + i_box];
    };

    std::vector<cv::Rect2f> boxes;
    std::vector<float> scores;
    std::vector<int> classes;

    for (int i = 0; i < N; ++i) {
        int best_cls = -1;
        float best_score = -1.0f;
        for (int c = 0; c < num_classes; ++c) {
            float p = get_at(4 + c, i);
            if (p > best_score) {
                best_score = p;
                best_cls = c;
            }
        }
        if (best_score < static_cast<float>(config_.threshold)) {
            continue;
        }
        const std::string label = best_cls < static_cast<int>(class_names_.size())
                                      ? class_names_[best_cls]
                                      : "class_" + std::to_string(best_cls);
        if (!isVehicle(best_cls, label)) {
            continue;
        }

        const float cx = get_at(0, i);
        const float cy = get_at(1, i);
        const float w = get_at(2, i);
        const float h = get_at(3, i);

        float x1 = std::clamp((cx - w * 0.5f - prep.pad_x) / prep.scale, 0.f, (float)image.cols - 1);
        float y1 = std::clamp((cy - h * 0.5f - prep.pad_y) / prep.scale, 0.f, (float)image.rows - 1);
        float x2 = std::clamp((cx + w * 0.5f - prep.pad_x) / prep.scale, 0.f, (float)image.cols - 1);
        float y2 = std::clamp((cy + h * 0.5f - prep.pad_y) / prep.scale, 0.f, (float)image.rows - 1);
        if (x2 <= x1 || y2 <= y1) {
            continue;
        }

        boxes.emplace_back(x1, y1, x2 - x1, y2 - y1);
        scores.push_back(best_score);
        classes.push_back(best_cls);
    }

    for (int idx : NMS(boxes, scores, static_cast<float>(config_.nms_threshold))) {
        const auto& r = boxes[idx];
        Detection det;
        det.box = BoundingBox{(int)std::round(r.x), (int)std::round(r.y),
                              (int)std::round(r.x + r.width), (int)std::round(r.y + r.height)};
        det.class_id = classes[idx];
        det.label = det.class_id < static_cast<int>(class_names_.size()) ? class_names_[det.class_id]
                                                                          : "class_" + std::to_string(det.class_id);
        det.confidence = scores[idx];
        detections.push_back(std::move(det));
    }
#endif
    return detections;
}

}  // namespace redlight
