#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <opencv2/core.hpp>

#include "posture/alert_tracker.hpp"
#include "posture/camera.hpp"
#include "posture/camera_health.hpp"
#include "posture/classifier.hpp"
#include "posture/config.hpp"
#include "posture/distributor.hpp"
#include "posture/event_store.hpp"
#include "posture/events.hpp"
#include "posture/pose.hpp"
#include "posture/watchdog.hpp"

namespace posture {

struct PipelineCollaborators {
    ResultDistributor* distributor = nullptr;   // required
    EventPublisher* publisher = nullptr;        // required
    EventSink* event_sink = nullptr;
    LivenessReporter* liveness = nullptr;
    Sleeper sleeper;                            // defaults to a real sleep
    SecondsClock clock;                         // defaults to the steady clock
    // How long stop() waits for the worker, before and again after forcing the
    // camera closed.
    std::chrono::milliseconds stop_timeout{5000};
};

// Capture -> detect -> classify -> track alert -> camera health -> distribute,
// once per cycle on a single worker thread. pause(), resume() and status()
// may be called from any thread.
class MonitoringPipeline {
public:
    MonitoringPipeline(const AppConfig& config,
                       std::unique_ptr<FrameSource> source,
                       std::unique_ptr<PoseEngine> engine,
                       PipelineCollaborators collaborators);
    ~MonitoringPipeline();

    MonitoringPipeline(const MonitoringPipeline&) = delete;
    MonitoringPipeline& operator=(const MonitoringPipeline&) = delete;

    // Opens the camera and starts the worker. Returns false (and leaves the
    // worker stopped) when the camera needs operator action.
    bool start();
    // Bounded: a worker still blocked after the camera is forced closed is
    // detached and left to the process exit.
    void stop();
    bool isRunning() const { return running_.load(); }

    // Runs one full cycle synchronously. Used by the worker and by tests.
    void runCycle();

    void pause();
    void resume();
    MonitoringStatus status() const;
    CameraState cameraState() const { return camera_state_.load(); }

    std::optional<CaptureDiagnostic> lastDiagnostic() const;

private:
    void workerLoop(std::promise<void> done);
    bool reconnectAttempt();
    void processFrame(cv::Mat& frame);
    void onCameraStatus(CameraState state);
    void publishMonitoringStatus();

    const int fps_target_;
    const int jpeg_quality_;
    const std::chrono::milliseconds processing_error_pause_{100};
    const std::chrono::milliseconds stop_timeout_;

    std::unique_ptr<FrameSource> source_;
    PoseEstimator estimator_;
    PostureClassifier classifier_;
    AlertTracker tracker_;
    CameraHealthMonitor health_;
    PostureChangeDetector changes_;

    ResultDistributor& distributor_;
    EventPublisher& publisher_;
    LivenessReporter* liveness_;
    Sleeper sleeper_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<CameraState> camera_state_{CameraState::Connected};
    std::thread worker_;
    std::future<void> worker_done_;
    int consecutive_failures_ = 0;

    mutable std::mutex diagnostic_mutex_;
    std::optional<CaptureDiagnostic> last_diagnostic_;
};

}  // namespace posture
