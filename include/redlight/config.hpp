#pragma once

#include <string>
#include <vector>

#include "redlight/json.hpp"
#include "redlight/types.hpp"

namespace redlight {

struct FineConfig {
    double base_fine{100.0};
    double repeat_multiplier{1.5};
    double school_zone_factor{2.0};
    double night_factor{1.2};
    int night_start{22};    // hour of day
    int night_end{6};       // hour of day
};

struct EvidenceConfig {
    std::string output_dir{"output"};
    double clip_seconds{3.0};
    double window_seconds{10.0};

    std::string imageDir() const { return output_dir + "/images"; }
    std::string clipDir() const { return output_dir + "/clips"; }
};

struct DetectorConfig {
    std::string model_path{"yolov8n.onnx"};
    std::string names_path;
    double threshold{0.35};
    double nms_threshold{0.45};
    std::vector<std::string> vehicle_labels{"car", "motorcycle", "bus", "truck"};
};

struct TrackerConfig {
    double iou_threshold{0.3};
    int max_age{30};
};

struct OcrConfig {
    std::vector<std::string> backends{"crnn", "tesseract"};
    std::string crnn_model{"plate_crnn.onnx"};
    std::string alphabet{"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ"};
    std::string tesseract_command{"tesseract"};
    double tesseract_confidence{0.7};
};

struct SinkConfig {
    std::string type{"mqtt"};    // "mqtt" or "jsonl"
    std::string jsonl_path{"output/violations.jsonl"};
};

struct MqttConfig {
    std::string server{"127.0.0.1"};
    int port{1883};
    std::string client_id{"redlight"};
    std::string publish_topic{"redlight/violations"};
    std::string username;
    std::string password;
    int qos{1};
    int keep_alive{60};
    bool append_mac{true};
};

struct CameraConfig {
    std::string id{"cam0"};
    std::string video;
    StopLine stop_line;
    std::string signal_json;
    std::string output;
    std::string start_time;    // ISO-8601; empty means "when processing starts"
    bool force_red{false};
    ZoneFactors zone;
};

struct AppConfig {
    std::string version;
    std::string source_path;
    std::string location_id{"DEFAULT_LOCATION_000"};
    int thread_pool_size{1};
    FineConfig fine;
    EvidenceConfig evidence;
    DetectorConfig detector;
    TrackerConfig tracker;
    OcrConfig ocr;
    SinkConfig sink;
    MqttConfig mqtt;
    std::string profiles_path{"output/profiles.json"};
    std::vector<CameraConfig> cameras;
};

AppConfig parseConfig(const JsonValue& root, const std::string& base_dir);
AppConfig loadConfig(const std::string& path);

// LOCATION_ID, OCR_BACKEND, YOLO_WEIGHTS_PATH, BASE_FINE, REPEAT_OFFENDER_MULTIPLIER,
// SCHOOL_ZONE_FACTOR, NIGHT_HOUR_START, NIGHT_HOUR_END, NIGHT_FACTOR.
void applyEnvironment(AppConfig& config);

void validateConfig(const AppConfig& config);

}  // namespace redlight
