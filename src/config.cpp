#include "redlight/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "redlight/common.hpp"

namespace redlight {
namespace {

std::string resolvePath(const std::string& value, const std::filesystem::path& baseDir) {
    if (value.empty()) {
        return value;
    }
    std::filesystem::path path(value);
    if (path.is_absolute()) {
        return path.lexically_normal().generic_string();
    }
    return (baseDir / path).lexically_normal().generic_string();
}

std::vector<std::string> parseStrings(const JsonValue& value) {
    std::vector<std::string> out;
    if (!value.isArray()) {
        return out;
    }
    for (const auto& entry : value.asArray()) {
        out.push_back(entry.asString());
    }
    return out;
}

StopLine parseStopLineValue(const JsonValue& value) {
    if (value.isString()) {
        return parseStopLine(value.asString());
    }
    if (value.isArray() && value.asArray().size() == 4) {
        const auto& arr = value.asArray();
        return StopLine{Point{static_cast<int>(arr[0].asNumber()), static_cast<int>(arr[1].asNumber())},
                        Point{static_cast<int>(arr[2].asNumber()), static_cast<int>(arr[3].asNumber())}};
    }
    throw std::runtime_error("stop_line must be \"x1,y1,x2,y2\" or an array of four numbers");
}

FineConfig parseFine(const JsonValue& node) {
    FineConfig fine;
    fine.base_fine = node.getNumber("base_fine", fine.base_fine);
    fine.repeat_multiplier = node.getNumber("repeat_multiplier", fine.repeat_multiplier);
    fine.school_zone_factor = node.getNumber("school_zone_factor", fine.school_zone_factor);
    fine.night_factor = node.getNumber("night_factor", fine.night_factor);
    fine.night_start = static_cast<int>(node.getNumber("night_start", fine.night_start));
    fine.night_end = static_cast<int>(node.getNumber("night_end", fine.night_end));
    return fine;
}

EvidenceConfig parseEvidence(const JsonValue& node) {
    EvidenceConfig evidence;
    evidence.output_dir = node.getString("output_dir", evidence.output_dir);
    evidence.clip_seconds = node.getNumber("clip_seconds", evidence.clip_seconds);
    evidence.window_seconds = node.getNumber("window_seconds", evidence.window_seconds);
    return evidence;
}

DetectorConfig parseDetector(const JsonValue& node, const std::filesystem::path& baseDir) {
    DetectorConfig detector;
    detector.model_path = resolvePath(node.getString("model", detector.model_path), baseDir);
    detector.names_path = resolvePath(node.getString("names"), baseDir);
    detector.threshold = node.getNumber("threshold", detector.threshold);
    detector.nms_threshold = node.getNumber("nms_threshold", detector.nms_threshold);
    if (node.contains("vehicle_labels")) {
        detector.vehicle_labels = parseStrings(node.at("vehicle_labels"));
    }
    return detector;
}

TrackerConfig parseTracker(const JsonValue& node) {
    TrackerConfig tracker;
    tracker.iou_threshold = node.getNumber("iou_threshold", tracker.iou_threshold);
    tracker.max_age = static_cast<int>(node.getNumber("max_age", tracker.max_age));
    return tracker;
}

OcrConfig parseOcr(const JsonValue& node, const std::filesystem::path& baseDir) {
    OcrConfig ocr;
    if (node.contains("backends")) {
        ocr.backends = parseStrings(node.at("backends"));
    }
    ocr.crnn_model = resolvePath(node.getString("crnn_model", ocr.crnn_model), baseDir);
    ocr.alphabet = node.getString("alphabet", ocr.alphabet);
    ocr.tesseract_command = node.getString("tesseract_command", ocr.tesseract_command);
    ocr.tesseract_confidence = node.getNumber("tesseract_confidence", ocr.tesseract_confidence);
    return ocr;
}

MqttConfig parseMqtt(const JsonValue& node) {
    MqttConfig mqtt;
    mqtt.server = node.getString("server", mqtt.server);
    mqtt.port = static_cast<int>(node.getNumber("port", mqtt.port));
    mqtt.client_id = node.getString("client_id", mqtt.client_id);
    mqtt.publish_topic = node.getString("publish_topic", mqtt.publish_topic);
    mqtt.username = node.getString("username");
    mqtt.password = node.getString("password");
    mqtt.qos = static_cast<int>(node.getNumber("qos", mqtt.qos));
    mqtt.keep_alive = static_cast<int>(node.getNumber("keep_alive", mqtt.keep_alive));
    mqtt.append_mac = node.getBool("append_mac", mqtt.append_mac);
    return mqtt;
}

CameraConfig parseCamera(const JsonValue& node) {
    CameraConfig camera;
    camera.id = node.getString("id", camera.id);
    camera.video = node.getString("video");
    if (!node.contains("stop_line")) {
        throw std::runtime_error("Camera '" + camera.id + "' is missing 'stop_line'");
    }
    camera.stop_line = parseStopLineValue(node.at("stop_line"));
    camera.signal_json = node.getString("signal_json");
    camera.output = node.getString("output");
    camera.start_time = node.getString("start_time");
    camera.force_red = node.getBool("force_red", false);
    camera.zone.is_school_zone = node.getBool("school_zone", false);
    return camera;
}

double envNumber(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        std::cerr << "[Config] Ignoring non-numeric " << name << "=" << value << std::endl;
        return fallback;
    }
}

}  // namespace

AppConfig parseConfig(const JsonValue& root, const std::string& base_dir) {
    if (!root.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    const std::filesystem::path baseDir(base_dir.empty() ? "." : base_dir);

    AppConfig config;
    config.version = root.getString("version");
    config.location_id = root.getString("location_id", config.location_id);
    config.thread_pool_size = static_cast<int>(root.getNumber("thread_pool_size", config.thread_pool_size));

    if (root.contains("fine")) {
        config.fine = parseFine(root.at("fine"));
    }
    if (root.contains("evidence")) {
        config.evidence = parseEvidence(root.at("evidence"));
    }
    if (root.contains("detector")) {
        config.detector = parseDetector(root.at("detector"), baseDir);
    }
    if (root.contains("tracker")) {
        config.tracker = parseTracker(root.at("tracker"));
    }
    if (root.contains("ocr")) {
        config.ocr = parseOcr(root.at("ocr"), baseDir);
    }
    if (root.contains("sink")) {
        const auto& sink = root.at("sink");
        config.sink.type = sink.getString("type", config.sink.type);
        config.sink.jsonl_path = sink.getString("jsonl_path", config.sink.jsonl_path);
    }
    if (root.contains("mqtt")) {
        config.mqtt = parseMqtt(root.at("mqtt"));
    }
    if (root.contains("profiles")) {
        config.profiles_path = root.at("profiles").getString("path", config.profiles_path);
    }
    if (root.contains("cameras")) {
        for (const auto& camera : root.at("cameras").asArray()) {
            config.cameras.push_back(parseCamera(camera));
        }
    }
    return config;
}

AppConfig loadConfig(const std::string& path) {
    JsonValue root = parseJsonFile(path);

    std::filesystem::path absolutePath = std::filesystem::absolute(path).lexically_normal();
    AppConfig config = parseConfig(root, absolutePath.parent_path().generic_string());
    config.source_path = absolutePath.generic_string();
    return config;
}

void applyEnvironment(AppConfig& config) {
    if (const char* env = std::getenv("LOCATION_ID")) config.location_id = env;
    if (const char* env = std::getenv("YOLO_WEIGHTS_PATH")) config.detector.model_path = env;
    if (const char* env = std::getenv("OCR_BACKEND")) {
        // The named backend goes first; the rest of the chain stays as configured.
        std::string backend = env;
        std::vector<std::string> chain{backend};
        for (const auto& name : config.ocr.backends) {
            if (name != backend) chain.push_back(name);
        }
        config.ocr.backends = chain;
    }

    config.fine.base_fine = envNumber("BASE_FINE", config.fine.base_fine);
    config.fine.repeat_multiplier = envNumber("REPEAT_OFFENDER_MULTIPLIER", config.fine.repeat_multiplier);
    config.fine.school_zone_factor = envNumber("SCHOOL_ZONE_FACTOR", config.fine.school_zone_factor);
    config.fine.night_start = static_cast<int>(envNumber("NIGHT_HOUR_START", config.fine.night_start));
    config.fine.night_end = static_cast<int>(envNumber("NIGHT_HOUR_END", config.fine.night_end));
    config.fine.night_factor = envNumber("NIGHT_FACTOR", config.fine.night_factor);
}

void validateConfig(const AppConfig& config) {
    if (config.fine.base_fine < 0.0) {
        throw std::runtime_error("fine.base_fine must not be negative");
    }
    if (config.fine.night_start < 0 || config.fine.night_start > 23 ||
        config.fine.night_end < 0 || config.fine.night_end > 23) {
        throw std::runtime_error("fine.night_start and fine.night_end must be hours in [0, 23]");
    }
    if (config.evidence.window_seconds <= 0.0 || config.evidence.clip_seconds < 0.0) {
        throw std::runtime_error("evidence.window_seconds must be positive and clip_seconds non-negative");
    }
    if (config.sink.type != "mqtt" && config.sink.type != "jsonl") {
        throw std::runtime_error("sink.type must be 'mqtt' or 'jsonl', got '" + config.sink.type + "'");
    }
    if (config.thread_pool_size < 1) {
        throw std::runtime_error("thread_pool_size must be at least 1");
    }
}

}  // namespace redlight
