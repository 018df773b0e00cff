#pragma once

#include <memory>
#include <string>

#include "posture/alert_tracker.hpp"
#include "posture/camera_health.hpp"
#include "posture/json.hpp"
#include "posture/landmarks.hpp"

namespace posture {

namespace event {
constexpr const char* kCameraStatus = "camera_status";
constexpr const char* kPostureSnapshot = "posture_snapshot";
constexpr const char* kAlertTriggered = "alert_triggered";
constexpr const char* kPostureCorrected = "posture_corrected";
constexpr const char* kMonitoringStatus = "monitoring_status";
constexpr const char* kServiceStatus = "service_status";
constexpr const char* kControlResult = "control_result";
constexpr const char* kViewerStatus = "status";
}  // namespace event

// Immutable per-cycle result handed to the distributor.
struct ResultSnapshot {
    std::string timestamp;
    Posture posture = Posture::Unknown;
    bool user_present = false;
    double confidence = 0.0;
    std::string encoded_frame;   // base64 JPEG, empty when encoding was skipped
    CameraState camera_state = CameraState::Connected;
    AlertOutcome alert;
};

using SnapshotPtr = std::shared_ptr<const ResultSnapshot>;

// Local time, ISO-8601 with microseconds.
std::string currentTimestamp();

Json toJson(const AlertOutcome& outcome);
Json toJson(const MonitoringStatus& status);
Json toJson(const ResultSnapshot& snapshot);

Json cameraStatusEvent(CameraState state, const std::string& timestamp);
Json alertTriggeredEvent(int duration, const std::string& timestamp);
Json postureCorrectedEvent(int previous_duration, const std::string& timestamp);
Json viewerStatusMessage(const std::string& message, const std::string& timestamp);

// Outbound event sink. Implementations must be callable from any thread.
class EventPublisher {
public:
    virtual ~EventPublisher() = default;
    virtual void publish(const std::string& event_name, const Json& payload) = 0;
};

}  // namespace posture
