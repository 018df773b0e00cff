#include "posture/service.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "posture/camera.hpp"
#include "posture/diagnostics.hpp"
#include "posture/events.hpp"
#include "posture/yolo_pose.hpp"

namespace posture {

ControlDispatcher::ControlDispatcher(MonitoringPipeline& pipeline, ResultDistributor& distributor,
                                     ViewerFactory make_viewer)
    : pipeline_(pipeline), distributor_(distributor), make_viewer_(std::move(make_viewer)) {
    if (!make_viewer_) {
        throw std::invalid_argument("Viewer factory must not be empty");
    }
}

Json ControlDispatcher::handle(const Json& request) {
    return handle(parseControlCommand(request));
}

Json ControlDispatcher::handle(const ControlCommand& command) {
    Json reply = Json::object();
    reply["action"] = controlActionName(command.action);

    switch (command.action) {
    case ControlAction::Pause:
        pipeline_.pause();
        std::cout << "[Service] Monitoring paused" << std::endl;
        break;
    case ControlAction::Resume:
        pipeline_.resume();
        std::cout << "[Service] Monitoring resumed" << std::endl;
        break;
    case ControlAction::GetStatus:
        break;
    case ControlAction::ConnectViewer:
        distributor_.connect(command.viewer_id, make_viewer_(command.viewer_id));
        reply["viewer_id"] = command.viewer_id;
        break;
    case ControlAction::DisconnectViewer:
        reply["viewer_id"] = command.viewer_id;
        reply["disconnected"] = distributor_.disconnect(command.viewer_id);
        break;
    }

    reply["status"] = statusReport();
    return reply;
}

Json ControlDispatcher::statusReport() const {
    Json status = toJson(pipeline_.status());
    status["camera_state"] = cameraStateName(pipeline_.cameraState());
    status["viewer_count"] = static_cast<int>(distributor_.viewerCount());
    return status;
}

MonitorService::MonitorService(AppConfig config) : config_(std::move(config)) {
    validateConfig(config_);

    PoseModelSpec spec = PoseModelSpec::load(config_.pose.model_spec);
    auto engine = std::make_unique<YoloPoseEngine>(config_.pose.model_path, spec,
                                                   static_cast<float>(config_.pose.min_detection_confidence));
    engine->load();

    if (!config_.event_store.path.empty()) {
        event_store_ = std::make_unique<JsonLinesEventStore>(config_.event_store.path);
    }
    liveness_ = LivenessReporter::fromEnvironment(std::chrono::seconds(config_.watchdog.interval_seconds));

    mqtt_ = std::make_unique<MqttService>(config_.mqtt, config_.service, [this](const Json& request) {
        if (!dispatcher_) {
            throw std::runtime_error("Service is not ready");
        }
        return dispatcher_->handle(request);
    });

    PipelineCollaborators collaborators;
    collaborators.distributor = &distributor_;
    collaborators.publisher = mqtt_.get();
    collaborators.event_sink = event_store_.get();
    collaborators.liveness = liveness_.get();

    pipeline_ = std::make_unique<MonitoringPipeline>(config_, std::make_unique<CameraCapture>(config_.camera),
                                                     std::move(engine), std::move(collaborators));

    dispatcher_ = std::make_unique<ControlDispatcher>(*pipeline_, distributor_, [this](const std::string& id) {
        return std::unique_ptr<ViewerChannel>(std::make_unique<MqttViewerChannel>(*mqtt_, id));
    });
}

MonitorService::~MonitorService() {
    shutdown();
}

void MonitorService::run() {
    if (!pipeline_->start()) {
        std::optional<CaptureDiagnostic> diagnostic = pipeline_->lastDiagnostic();
        throw std::runtime_error(diagnostic ? formatDiagnostic(*diagnostic) : "Camera could not be opened");
    }
    if (liveness_) {
        liveness_->ready();
    }
    std::cout << "[Service] " << config_.service.name << " monitoring started" << std::endl;

    try {
        mqtt_->run();
    } catch (const std::exception& ex) {
        std::cerr << "[Service] MQTT loop failed: " << ex.what() << std::endl;
        shutdown();
        throw;
    }
    shutdown();
}

void MonitorService::stop() {
    mqtt_->stop();
}

void MonitorService::shutdown() {
    if (liveness_) {
        liveness_->stopping();
    }
    if (pipeline_) {
        pipeline_->stop();
    }
    distributor_.stopAll();
}

}  // namespace posture
