#include "posture/pipeline.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "posture/common.hpp"

namespace posture {
namespace {

constexpr int kFailureLogRate = 10;

template <typename T>
T& required(T* ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string(what) + " must not be null");
    }
    return *ptr;
}

RecoveryPolicy toPolicy(const RecoveryConfig& config) {
    RecoveryPolicy policy;
    policy.quick_retries = config.quick_retries;
    policy.quick_retry_delay = std::chrono::milliseconds(config.quick_retry_delay_ms);
    policy.long_retry_interval = std::chrono::seconds(config.long_retry_interval_seconds);
    policy.hardware_fault_pause = std::chrono::milliseconds(config.hardware_fault_pause_ms);
    return policy;
}

std::unique_ptr<FrameSource> requireSource(std::unique_ptr<FrameSource> source) {
    if (!source) {
        throw std::invalid_argument("Frame source must not be null");
    }
    return source;
}

}  // namespace

MonitoringPipeline::MonitoringPipeline(const AppConfig& config,
                                       std::unique_ptr<FrameSource> source,
                                       std::unique_ptr<PoseEngine> engine,
                                       PipelineCollaborators collaborators)
    : fps_target_(config.camera.fps_target > 0 ? config.camera.fps_target : 10),
      jpeg_quality_(config.camera.jpeg_quality),
      stop_timeout_(collaborators.stop_timeout),
      source_(requireSource(std::move(source))),
      estimator_(std::move(engine), config.pose.min_tracking_confidence),
      classifier_(config.posture.angle_threshold, config.posture.slouch_check, estimator_.layout()),
      tracker_(config.alerts.threshold_seconds, config.alerts.cooldown_seconds, collaborators.clock),
      health_(toPolicy(config.recovery), [this](CameraState state) { onCameraStatus(state); }, collaborators.sleeper),
      changes_(collaborators.event_sink),
      distributor_(required(collaborators.distributor, "Result distributor")),
      publisher_(required(collaborators.publisher, "Event publisher")),
      liveness_(collaborators.liveness),
      sleeper_(collaborators.sleeper ? collaborators.sleeper : threadSleeper()) {
    health_.setRunningCheck([this]() { return !stop_requested_.load(); });
    health_.setHeartbeat([this]() {
        if (liveness_) {
            liveness_->ping();
        }
    });
}

MonitoringPipeline::~MonitoringPipeline() {
    stop();
}

bool MonitoringPipeline::start() {
    if (running_.load()) {
        return true;
    }
    stop_requested_.store(false);

    OpenResult opened = source_->open();
    if (opened.success) {
        camera_state_.store(health_.state());
        publisher_.publish(event::kCameraStatus, cameraStatusEvent(health_.state(), currentTimestamp()));
    } else {
        CaptureDiagnostic diagnostic;
        if (opened.diagnostic) {
            diagnostic = *opened.diagnostic;
        } else {
            diagnostic.message = "Camera failed to open";
            diagnostic.retry_recommended = true;
        }
        {
            std::lock_guard<std::mutex> lock(diagnostic_mutex_);
            last_diagnostic_ = diagnostic;
        }

        std::cerr << "[Pipeline] Camera unavailable (" << captureFaultName(diagnostic.fault)
                  << "): " << diagnostic.message << std::endl;
        if (!diagnostic.retry_recommended) {
            std::cerr << diagnostic.remediation << std::endl;
            camera_state_.store(CameraState::Disconnected);
            publisher_.publish(event::kCameraStatus, cameraStatusEvent(CameraState::Disconnected, currentTimestamp()));
            return false;
        }
        // Retry-eligible: the worker keeps trying through the long retry path.
        health_.markDisconnected();
    }

    running_.store(true);
    std::promise<void> done;
    worker_done_ = done.get_future();
    worker_ = std::thread(&MonitoringPipeline::workerLoop, this, std::move(done));

    publishMonitoringStatus();
    std::cout << "[Pipeline] Started: fps_target=" << fps_target_ << " camera=" << source_->describe() << std::endl;
    return true;
}

void MonitoringPipeline::stop() {
    stop_requested_.store(true);
    if (!running_.exchange(false)) {
        source_->release();
        return;
    }

    if (worker_.joinable()) {
        auto finished = [this]() {
            return !worker_done_.valid() || worker_done_.wait_for(stop_timeout_) != std::future_status::timeout;
        };
        bool done = finished();
        if (!done) {
            std::cerr << "[Pipeline] Worker did not stop within " << stop_timeout_.count()
                      << "ms, releasing camera" << std::endl;
            source_->release();
            done = finished();
        }
        if (done) {
            worker_.join();
        } else {
            std::cerr << "[Pipeline] Worker still blocked, leaving it behind" << std::endl;
            worker_.detach();
        }
    }
    source_->release();
    std::cout << "[Pipeline] Stopped" << std::endl;
}

void MonitoringPipeline::workerLoop(std::promise<void> done) {
    const auto frame_interval = std::chrono::microseconds(1000000 / fps_target_);
    auto last_frame = std::chrono::steady_clock::time_point{};

    std::cout << "[Pipeline] Worker started, frame interval "
              << std::chrono::duration_cast<std::chrono::milliseconds>(frame_interval).count() << "ms" << std::endl;

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now - last_frame < frame_interval) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        last_frame = now;
        runCycle();
    }

    std::cout << "[Pipeline] Worker terminated" << std::endl;
    done.set_value();
}

void MonitoringPipeline::runCycle() {
    if (liveness_) {
        liveness_->ping();
    }

    auto attempt = [this]() { return reconnectAttempt(); };

    try {
        if (health_.state() == CameraState::Disconnected &&
            health_.attemptReconnect(attempt) != CameraState::Connected) {
            return;
        }

        cv::Mat frame;
        bool ok = false;
        try {
            ok = source_->read(frame);
        } catch (const CameraHardwareError& ex) {
            std::cerr << "[Pipeline] Camera hardware fault: " << ex.what() << std::endl;
            sleeper_(health_.reportHardwareFault());
            return;
        }

        if (!ok) {
            ++consecutive_failures_;
            if (consecutive_failures_ % kFailureLogRate == 1) {
                std::cerr << "[Pipeline] Frame capture failed (count: " << consecutive_failures_ << ")" << std::endl;
            }
            health_.handleReadFailure(attempt);
            return;
        }

        if (consecutive_failures_ > 0) {
            std::cout << "[Pipeline] Camera recovered after " << consecutive_failures_ << " failures" << std::endl;
            consecutive_failures_ = 0;
        }
        health_.reportReadSuccess();

        processFrame(frame);
    } catch (const std::exception& ex) {
        // Estimation, classification and encoding faults never touch the
        // camera state.
        std::cerr << "[Pipeline] Processing error: " << ex.what() << std::endl;
        sleeper_(processing_error_pause_);
    }
}

bool MonitoringPipeline::reconnectAttempt() {
    source_->release();
    OpenResult opened = source_->open();
    if (!opened.success) {
        if (opened.diagnostic) {
            std::lock_guard<std::mutex> lock(diagnostic_mutex_);
            last_diagnostic_ = opened.diagnostic;
        }
        return false;
    }

    cv::Mat probe;
    try {
        return source_->read(probe);
    } catch (const CameraHardwareError& ex) {
        std::cerr << "[Pipeline] Reconnect read failed: " << ex.what() << std::endl;
        return false;
    }
}

void MonitoringPipeline::processFrame(cv::Mat& frame) {
    PoseDetection detection = estimator_.detect(frame);
    Posture posture = classifier_.classify(detection.landmarks);

    std::string encoded;
    if (!frame.empty()) {
        estimator_.renderOverlay(frame, detection.landmarks, PostureClassifier::displayColor(posture));
        encoded = encodeJpegBase64(frame, jpeg_quality_);
    }

    AlertOutcome outcome = tracker_.update(posture, detection.user_present);
    std::string timestamp = currentTimestamp();

    PostureChangeRecord record;
    record.timestamp = timestamp;
    record.state = posture;
    record.user_present = detection.user_present;
    record.confidence = detection.confidence;
    record.metadata["detection"] = detectionKindName(detection.kind);
    if (auto measurement = classifier_.measure(detection.landmarks)) {
        record.metadata["torso_angle"] = measurement->torso_angle;
        if (measurement->neck_angle) {
            record.metadata["neck_angle"] = *measurement->neck_angle;
        }
    }
    try {
        changes_.observe(record);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Failed to persist posture change: " << ex.what() << std::endl;
    }

    if (outcome.should_alert) {
        publisher_.publish(event::kAlertTriggered, alertTriggeredEvent(outcome.duration, timestamp));
    }
    if (outcome.posture_corrected) {
        publisher_.publish(event::kPostureCorrected, postureCorrectedEvent(outcome.previous_duration, timestamp));
    }

    auto snapshot = std::make_shared<ResultSnapshot>();
    snapshot->timestamp = timestamp;
    snapshot->posture = posture;
    snapshot->user_present = detection.user_present;
    snapshot->confidence = detection.confidence;
    snapshot->encoded_frame = std::move(encoded);
    snapshot->camera_state = health_.state();
    snapshot->alert = outcome;
    distributor_.publish(std::move(snapshot));
}

void MonitoringPipeline::onCameraStatus(CameraState state) {
    camera_state_.store(state);
    publisher_.publish(event::kCameraStatus, cameraStatusEvent(state, currentTimestamp()));
    if (liveness_) {
        liveness_->status(std::string("camera ") + cameraStateName(state));
    }
}

void MonitoringPipeline::pause() {
    tracker_.pause();
    publishMonitoringStatus();
}

void MonitoringPipeline::resume() {
    tracker_.resume();
    publishMonitoringStatus();
}

MonitoringStatus MonitoringPipeline::status() const {
    return tracker_.status();
}

std::optional<CaptureDiagnostic> MonitoringPipeline::lastDiagnostic() const {
    std::lock_guard<std::mutex> lock(diagnostic_mutex_);
    return last_diagnostic_;
}

void MonitoringPipeline::publishMonitoringStatus() {
    publisher_.publish(event::kMonitoringStatus, toJson(tracker_.status()));
}

}  // namespace posture
