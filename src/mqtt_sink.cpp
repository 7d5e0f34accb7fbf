#include "redlight/sink.hpp"

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <mosquitto.h>

#include "redlight/common.hpp"

namespace redlight {

struct MqttViolationSink::Impl {
    explicit Impl(MqttConfig cfg) : config(std::move(cfg)) {
        mosquitto_lib_init();

        client_id = config.client_id;
        if (config.append_mac) {
            const std::string mac = detectLocalMac();
            if (!mac.empty()) {
                client_id += "_" + mac;
            }
        }

        client.reset(mosquitto_new(client_id.empty() ? nullptr : client_id.c_str(), true, this));
        if (!client) {
            mosquitto_lib_cleanup();
            throw std::runtime_error("Failed to create MQTT client");
        }

        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_disconnect_callback_set(client.get(), &Impl::onDisconnect);
        mosquitto_reconnect_delay_set(client.get(), 1, 8, true);

        if (!config.username.empty()) {
            const char* password = config.password.empty() ? nullptr : config.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), config.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                mosquitto_destroy(client.release());
                mosquitto_lib_cleanup();
                throw std::runtime_error(std::string("Failed to set MQTT credentials: ") + mosquitto_strerror(rc));
            }
        } else if (!config.password.empty()) {
            mosquitto_destroy(client.release());
            mosquitto_lib_cleanup();
            throw std::runtime_error("MQTT password provided without username");
        }

        status_topic = config.publish_topic + "/status";
        const std::string will = statusPayload("offline");
        mosquitto_will_set(client.get(), status_topic.c_str(), static_cast<int>(will.size()), will.data(), 1, true);
    }

    ~Impl() {
        if (client) {
            mosquitto_destroy(client.release());
        }
        mosquitto_lib_cleanup();
    }

    std::string statusPayload(const std::string& state) const {
        JsonValue payload = makeObject();
        auto& obj = payload.asObject();
        obj["type"] = "service_registration";
        obj["state"] = state;
        obj["client_id"] = client_id;
        return payload.dump(-1);
    }

    bool publishRaw(const std::string& topic, const std::string& payload, bool retain) {
        int rc = mosquitto_publish(client.get(), nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), config.qos, retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to publish to " << topic << ": " << mosquitto_strerror(rc) << std::endl;
            return false;
        }
        return true;
    }

    static void onConnect(struct mosquitto*, void* userdata, int rc) {
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc == 0) {
            self->connected.store(true);
            self->publishRaw(self->status_topic, self->statusPayload("online"), true);
            std::cout << "[MQTT] Connected as " << self->client_id << std::endl;
        } else {
            std::cerr << "[MQTT] Connect failed: " << mosquitto_connack_string(rc) << std::endl;
        }
    }

    static void onDisconnect(struct mosquitto*, void* userdata, int rc) {
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        self->connected.store(false);
        if (rc != 0) {
            std::cerr << "[MQTT] Unexpected disconnect: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    MqttConfig config;
    std::string client_id;
    std::string status_topic;
    std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client{nullptr, mosquitto_destroy};
    std::atomic<bool> connected{false};
    bool loop_running = false;
};

MqttViolationSink::MqttViolationSink(MqttConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

MqttViolationSink::~MqttViolationSink() {
    disconnect();
}

bool MqttViolationSink::connect() {
    const auto& cfg = impl_->config;
    if (cfg.server.empty()) {
        throw std::runtime_error("MQTT server address is empty");
    }
    if (impl_->loop_running) {
        return impl_->connected.load();
    }
    const int port = cfg.port > 0 ? cfg.port : 1883;
    int rc = mosquitto_connect(impl_->client.get(), cfg.server.c_str(), port, cfg.keep_alive);
    const bool reached = rc == MOSQ_ERR_SUCCESS;
    if (!reached) {
        std::cerr << "[MQTT] Broker " << cfg.server << ":" << port << " unreachable (" << mosquitto_strerror(rc)
                  << "), retrying in the background" << std::endl;
    }
    // The network loop keeps reconnecting after a failed first attempt.
    rc = mosquitto_loop_start(impl_->client.get());
    if (rc != MOSQ_ERR_SUCCESS) {
        std::cerr << "[MQTT] Failed to start network loop: " << mosquitto_strerror(rc) << std::endl;
        return false;
    }
    impl_->loop_running = true;
    std::cout << "[MQTT] Publishing violations to " << cfg.server << ":" << port << " topic "
              << cfg.publish_topic << std::endl;
    return reached;
}

void MqttViolationSink::disconnect() {
    if (!impl_ || !impl_->loop_running) {
        return;
    }
    const bool connected = impl_->connected.load();
    if (connected) {
        impl_->publishRaw(impl_->status_topic, impl_->statusPayload("offline"), true);
    }
    mosquitto_disconnect(impl_->client.get());
    // A loop still waiting to reconnect is cancelled rather than joined.
    mosquitto_loop_stop(impl_->client.get(), !connected);
    impl_->loop_running = false;
}

bool MqttViolationSink::submit(const ViolationRecord& record) {
    if (!impl_->loop_running || !impl_->connected.load()) {
        std::cerr << "[MQTT] Not connected, dropping violation " << record.id << std::endl;
        return false;
    }
    return impl_->publishRaw(impl_->config.publish_topic, violationToJson(record).dump(-1), false);
}

const std::string& MqttViolationSink::clientId() const {
    return impl_->client_id;
}

}  // namespace redlight
