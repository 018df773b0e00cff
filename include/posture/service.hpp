#pragma once

#include <functional>
#include <memory>
#include <string>

#include "posture/command.hpp"
#include "posture/config.hpp"
#include "posture/distributor.hpp"
#include "posture/event_store.hpp"
#include "posture/json.hpp"
#include "posture/mqtt.hpp"
#include "posture/pipeline.hpp"
#include "posture/watchdog.hpp"

namespace posture {

// Applies control commands to a running pipeline and builds the reply body.
class ControlDispatcher {
public:
    using ViewerFactory = std::function<std::unique_ptr<ViewerChannel>(const std::string& viewer_id)>;

    ControlDispatcher(MonitoringPipeline& pipeline, ResultDistributor& distributor, ViewerFactory make_viewer);

    Json handle(const Json& request);
    Json handle(const ControlCommand& command);

    Json statusReport() const;

private:
    MonitoringPipeline& pipeline_;
    ResultDistributor& distributor_;
    ViewerFactory make_viewer_;
};

// Owns every long-lived part of the monitor and wires them together.
class MonitorService {
public:
    explicit MonitorService(AppConfig config);
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    // Starts monitoring and blocks in the MQTT loop until stop(). Throws
    // std::runtime_error when the camera needs operator action or the broker
    // is unreachable.
    void run();
    void stop();

private:
    void shutdown();

    AppConfig config_;
    ResultDistributor distributor_;
    std::unique_ptr<JsonLinesEventStore> event_store_;
    std::unique_ptr<LivenessReporter> liveness_;
    std::unique_ptr<MqttService> mqtt_;
    std::unique_ptr<MonitoringPipeline> pipeline_;
    std::unique_ptr<ControlDispatcher> dispatcher_;
};

}  // namespace posture
