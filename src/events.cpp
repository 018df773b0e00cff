#include "posture/events.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace posture {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32] = {0};
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char buffer[48] = {0};
    std::snprintf(buffer, sizeof(buffer), "%s.%06lld", date, static_cast<long long>(micros));
    return buffer;
}

Json toJson(const AlertOutcome& outcome) {
    Json obj = Json::object();
    obj["should_alert"] = outcome.should_alert;
    obj["duration"] = outcome.duration;
    obj["threshold_reached"] = outcome.threshold_reached;
    if (outcome.posture_corrected) {
        obj["posture_corrected"] = true;
        obj["previous_duration"] = outcome.previous_duration;
    }
    return obj;
}

Json toJson(const MonitoringStatus& status) {
    Json obj = Json::object();
    obj["active"] = status.monitoring_active;
    obj["threshold"] = status.threshold_seconds;
    obj["cooldown"] = status.cooldown_seconds;
    return obj;
}

Json toJson(const ResultSnapshot& snapshot) {
    Json obj = Json::object();
    obj["timestamp"] = snapshot.timestamp;
    obj["posture_classification"] = postureName(snapshot.posture);
    obj["user_present"] = snapshot.user_present;
    obj["confidence"] = snapshot.confidence;
    if (snapshot.encoded_frame.empty()) {
        obj["encoded_frame"] = nullptr;
    } else {
        obj["encoded_frame"] = snapshot.encoded_frame;
    }
    obj["camera_health_state"] = cameraStateName(snapshot.camera_state);
    obj["alert_outcome"] = toJson(snapshot.alert);
    return obj;
}

Json cameraStatusEvent(CameraState state, const std::string& timestamp) {
    Json obj = Json::object();
    obj["state"] = cameraStateName(state);
    obj["timestamp"] = timestamp;
    return obj;
}

Json alertTriggeredEvent(int duration, const std::string& timestamp) {
    Json obj = Json::object();
    obj["duration"] = duration;
    obj["timestamp"] = timestamp;
    return obj;
}

Json postureCorrectedEvent(int previous_duration, const std::string& timestamp) {
    Json obj = Json::object();
    obj["previous_duration"] = previous_duration;
    obj["timestamp"] = timestamp;
    return obj;
}

Json viewerStatusMessage(const std::string& message, const std::string& timestamp) {
    Json obj = Json::object();
    obj["message"] = message;
    obj["timestamp"] = timestamp;
    return obj;
}

}  // namespace posture
