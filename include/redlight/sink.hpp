#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "redlight/config.hpp"
#include "redlight/json.hpp"
#include "redlight/types.hpp"

namespace redlight {

// vehicle_plate, fine_amount, image_path, video_clip_path, ocr_confidence,
// id, location_id, timestamp, violation_type, track_id, frame_index.
JsonValue violationToJson(const ViolationRecord& record);

// Receives each violation exactly once. submit() makes a single attempt and
// reports success; it may also throw, which callers count as a failure.
class ViolationSink {
public:
    virtual ~ViolationSink() = default;
    virtual bool submit(const ViolationRecord& record) = 0;
};

// Appends one JSON document per line. Shared between camera threads.
class JsonlViolationSink : public ViolationSink {
public:
    explicit JsonlViolationSink(std::string path);

    bool submit(const ViolationRecord& record) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

// Publishes each record as compact JSON on MqttConfig::publish_topic and
// announces online/offline on <publish_topic>/status.
class MqttViolationSink : public ViolationSink {
public:
    explicit MqttViolationSink(MqttConfig config);
    ~MqttViolationSink() override;

    // Starts the network loop. Returns false when the broker was not reached;
    // the loop keeps retrying and submit() fails until a connection is up.
    // Throws std::runtime_error only for an empty server address.
    bool connect();
    void disconnect();

    bool submit(const ViolationRecord& record) override;

    const std::string& clientId() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::unique_ptr<ViolationSink> makeViolationSink(const AppConfig& config);

}  // namespace redlight
