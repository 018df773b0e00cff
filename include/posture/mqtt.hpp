#pragma once

#include <functional>
#include <memory>
#include <string>

#include "posture/config.hpp"
#include "posture/distributor.hpp"
#include "posture/events.hpp"
#include "posture/json.hpp"

namespace posture {

// libmosquitto transport. Control requests arrive on the control topic,
// events leave on <event_topic>/<event_name>, viewer snapshots on
// <snapshot_topic>/<viewer_id>.
class MqttService : public EventPublisher {
public:
    // Handles one control request and returns the reply body.
    using Processor = std::function<Json(const Json& request)>;

    MqttService(MqttConfig config, ServiceInfo service, Processor processor);
    ~MqttService() override;

    MqttService(const MqttService&) = delete;
    MqttService& operator=(const MqttService&) = delete;

    // Blocks running the network loop until stop() is called. Throws
    // std::runtime_error when the broker cannot be reached initially.
    void run();
    void stop();

    void publish(const std::string& event_name, const Json& payload) override;

    // Returns false when the client rejected the message.
    bool publishTo(const std::string& topic, const Json& payload, int qos = 1);

    std::string eventTopic(const std::string& event_name) const;
    std::string snapshotTopic(const std::string& viewer_id) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Viewer channel over MQTT. send() throws when publishing fails so that the
// relay can isolate the failure.
class MqttViewerChannel : public ViewerChannel {
public:
    MqttViewerChannel(MqttService& mqtt, std::string viewer_id);

    void send(const std::string& event_name, const Json& payload) override;

private:
    MqttService& mqtt_;
    std::string viewer_id_;
    std::string topic_;
};

}  // namespace posture
