#include "posture/mqtt.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <mosquitto.h>

namespace posture {

struct MqttService::Impl {
    Impl(MqttConfig cfg, ServiceInfo svc, Processor proc)
        : config(std::move(cfg)), service(std::move(svc)), processor(std::move(proc)) {
        if (!processor) {
            throw std::invalid_argument("MQTT processor callback must not be empty");
        }
        mosquitto_lib_init();
        const char* client_id = nullptr;
        if (!config.client_id.empty()) {
            client_id = config.client_id.c_str();
        }

        client.reset(mosquitto_new(client_id, true, this));
        if (!client) {
            mosquitto_lib_cleanup();
            throw std::runtime_error("Failed to create MQTT client");
        }

        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_disconnect_callback_set(client.get(), &Impl::onDisconnect);
        mosquitto_message_callback_set(client.get(), &Impl::onMessage);
        mosquitto_reconnect_delay_set(client.get(), 1, 8, true);

        if (!config.username.empty()) {
            const char* password = config.password.empty() ? nullptr : config.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), config.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                mosquitto_destroy(client.release());
                mosquitto_lib_cleanup();
                throw std::runtime_error(std::string("Failed to set MQTT credentials: ") + mosquitto_strerror(rc));
            }
        }

        // The broker announces us offline if the connection drops unexpectedly.
        std::string will = statusPayload("offline").dump();
        std::string will_topic = eventTopic(event::kServiceStatus);
        int rc = mosquitto_will_set(client.get(), will_topic.c_str(), static_cast<int>(will.size()), will.data(), 1,
                                    true);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to set last will: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    ~Impl() {
        if (client) {
            mosquitto_destroy(client.release());
        }
        mosquitto_lib_cleanup();
    }

    std::string eventTopic(const std::string& event_name) const {
        return config.event_topic + "/" + event_name;
    }

    void run() {
        stop_requested.store(false);
        if (config.server.empty()) {
            throw std::runtime_error("MQTT server address is empty");
        }
        int port = config.port > 0 ? config.port : 1883;
        int keep_alive = 60;
        int rc = mosquitto_connect(client.get(), config.server.c_str(), port, keep_alive);
        if (rc != MOSQ_ERR_SUCCESS) {
            throw std::runtime_error(std::string("Failed to connect to MQTT broker: ") + mosquitto_strerror(rc));
        }
        std::cout << "[MQTT] Connecting to " << config.server << ":" << port << std::endl;

        while (!stop_requested.load()) {
            rc = mosquitto_loop(client.get(), 1000, 1);
            if (stop_requested.load()) {
                break;
            }
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] Loop warning: " << mosquitto_strerror(rc) << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
                mosquitto_reconnect(client.get());
            }
        }

        // Flush the offline announcement queued by stop().
        for (int i = 0; i < 5 && mosquitto_want_write(client.get()); ++i) {
            mosquitto_loop(client.get(), 100, 1);
        }
        mosquitto_disconnect(client.get());
    }

    void stop() {
        if (stop_requested.exchange(true)) {
            return;
        }
        publishJson(statusPayload("offline"), eventTopic(event::kServiceStatus), 1, true);
    }

    bool publishJson(const Json& value, const std::string& topic, int qos, bool retain = false) {
        std::string payload = value.dump();
        std::lock_guard<std::mutex> lock(publish_mutex);
        int rc = mosquitto_publish(client.get(), nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), qos, retain);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to publish to " << topic << ": " << mosquitto_strerror(rc) << std::endl;
            return false;
        }
        return true;
    }

    Json statusPayload(const std::string& state) const {
        Json payload = Json::object();
        payload["state"] = state;
        payload["service_name"] = service.name;
        payload["client_id"] = config.client_id;
        payload["timestamp"] = currentTimestamp();
        return payload;
    }

    void publishControlError(const std::string& error, const std::string& request_id) {
        Json payload = Json::object();
        payload["ok"] = false;
        payload["error"] = error;
        payload["service_name"] = service.name;
        if (!request_id.empty()) {
            payload["request_id"] = request_id;
        }
        publishJson(payload, eventTopic(event::kControlResult), 1);
    }

    void handleMessage(const mosquitto_message* message) {
        if (!message || !message->payload || message->payloadlen <= 0) {
            return;
        }
        std::string payload(static_cast<const char*>(message->payload),
                            static_cast<std::size_t>(message->payloadlen));
        std::string request_id;

        try {
            Json json = Json::parse(payload);
            if (json.contains("request_id") && json.at("request_id").is_string()) {
                request_id = json.at("request_id").as_string();
            }

            Json response = processor(json);
            if (!response.is_object()) {
                Json wrapper = Json::object();
                wrapper["payload"] = response;
                response = wrapper;
            }
            if (!response.contains("ok")) {
                response["ok"] = true;
            }
            response["service_name"] = service.name;
            if (!request_id.empty()) {
                response["request_id"] = request_id;
            }
            publishJson(response, eventTopic(event::kControlResult), 1);
        } catch (const std::exception& ex) {
            std::cerr << "[MQTT] Control request failed: " << ex.what() << std::endl;
            publishControlError(ex.what(), request_id);
        }
    }

    static void onConnect(struct mosquitto* mosq, void* userdata, int rc) {
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc == 0) {
            std::cout << "[MQTT] Connected" << std::endl;
            self->publishJson(self->statusPayload("online"), self->eventTopic(event::kServiceStatus), 1, true);
            if (!self->config.control_topic.empty()) {
                mosquitto_subscribe(mosq, nullptr, self->config.control_topic.c_str(), 1);
            }
        } else {
            std::cerr << "[MQTT] Connect failed: " << mosquitto_connack_string(rc) << std::endl;
        }
    }

    static void onDisconnect(struct mosquitto* mosq, void* userdata, int rc) {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc == 0) {
            std::cout << "[MQTT] Disconnected" << std::endl;
        } else {
            std::cerr << "[MQTT] Unexpected disconnect: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    static void onMessage(struct mosquitto* mosq, void* userdata, const mosquitto_message* message) {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        self->handleMessage(message);
    }

    MqttConfig config;
    ServiceInfo service;
    Processor processor;
    std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client{nullptr, mosquitto_destroy};
    std::atomic<bool> stop_requested{false};
    std::mutex publish_mutex;
};

MqttService::MqttService(MqttConfig config, ServiceInfo service, Processor processor)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(service), std::move(processor))) {}

MqttService::~MqttService() = default;

void MqttService::run() {
    impl_->run();
}

void MqttService::stop() {
    impl_->stop();
}

void MqttService::publish(const std::string& event_name, const Json& payload) {
    impl_->publishJson(payload, impl_->eventTopic(event_name), 1);
}

bool MqttService::publishTo(const std::string& topic, const Json& payload, int qos) {
    return impl_->publishJson(payload, topic, qos);
}

std::string MqttService::eventTopic(const std::string& event_name) const {
    return impl_->eventTopic(event_name);
}

std::string MqttService::snapshotTopic(const std::string& viewer_id) const {
    return impl_->config.snapshot_topic + "/" + viewer_id;
}

MqttViewerChannel::MqttViewerChannel(MqttService& mqtt, std::string viewer_id)
    : mqtt_(mqtt), viewer_id_(std::move(viewer_id)), topic_(mqtt_.snapshotTopic(viewer_id_)) {}

void MqttViewerChannel::send(const std::string& event_name, const Json& payload) {
    Json message = Json::object();
    message["event"] = event_name;
    message["data"] = payload;
    // Snapshots are ephemeral; a lost one is superseded by the next.
    int qos = event_name == event::kPostureSnapshot ? 0 : 1;
    if (!mqtt_.publishTo(topic_, message, qos)) {
        throw std::runtime_error("Failed to deliver " + event_name + " to viewer " + viewer_id_);
    }
}

}  // namespace posture
