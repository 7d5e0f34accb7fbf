#include "redlight/sink.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "redlight/common.hpp"

namespace redlight {

JsonValue violationToJson(const ViolationRecord& record) {
    JsonValue root = makeObject();
    auto& obj = root.asObject();
    obj["id"] = record.id;
    obj["vehicle_plate"] = record.vehicle_plate;
    obj["fine_amount"] = record.fine_amount;
    obj["image_path"] = record.image_path;
    obj["video_clip_path"] = record.video_clip_path;
    obj["ocr_confidence"] = record.ocr_confidence;
    obj["location_id"] = record.location_id;
    obj["violation_type"] = record.violation_type;
    obj["track_id"] = record.track_id;
    obj["frame_index"] = static_cast<long long>(record.frame_index);
    obj["timestamp"] = formatIsoTimestamp(record.timestamp);
    return root;
}

JsonlViolationSink::JsonlViolationSink(std::string path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("JSONL sink path must not be empty");
    }
}

bool JsonlViolationSink::submit(const ViolationRecord& record) {
    const std::string line = violationToJson(record).dump(-1);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[Sink] Cannot create " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        std::cerr << "[Sink] Unable to open violations file: " << path_ << std::endl;
        return false;
    }
    out << line << '\n';
    out.flush();
    return static_cast<bool>(out);
}

std::unique_ptr<ViolationSink> makeViolationSink(const AppConfig& config) {
    if (config.sink.type == "jsonl") {
        std::cout << "[Sink] Writing violations to " << config.sink.jsonl_path << std::endl;
        return std::make_unique<JsonlViolationSink>(config.sink.jsonl_path);
    }
    auto sink = std::make_unique<MqttViolationSink>(config.mqtt);
    if (!sink->connect()) {
        std::cerr << "[Sink] Processing continues; violations are counted as failed until MQTT connects"
                  << std::endl;
    }
    return sink;
}

}  // namespace redlight
