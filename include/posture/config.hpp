#pragma once

#include <string>

#include "posture/json.hpp"

namespace posture {

struct CameraConfig {
    int device = 0;
    int fps_target = 10;
    std::string resolution = "720p";
    int warmup_frames = 2;
    int jpeg_quality = 80;
};

struct PoseConfig {
    std::string model_path = "models/yolo11n-pose.onnx";
    std::string model_spec = "models/pose_model.yaml";
    double min_detection_confidence = 0.5;
    double min_tracking_confidence = 0.5;
};

struct PostureConfig {
    double angle_threshold = 15.0;   // degrees from vertical
    bool slouch_check = false;
};

struct AlertConfig {
    int threshold_seconds = 600;
    int cooldown_seconds = 300;
};

struct RecoveryConfig {
    int quick_retries = 3;
    int quick_retry_delay_ms = 1000;
    int long_retry_interval_seconds = 10;
    int hardware_fault_pause_ms = 1000;
};

struct WatchdogConfig {
    int interval_seconds = 14;
};

struct MqttConfig {
    std::string server;
    int port = 1883;
    std::string client_id = "posture-monitor";
    std::string username;
    std::string password;
    std::string control_topic = "posture/control";
    std::string event_topic = "posture/events";
    std::string snapshot_topic = "posture/snapshots";
};

struct EventStoreConfig {
    std::string path = "data/posture_events.jsonl";
};

struct ServiceInfo {
    std::string name = "posture-monitor";
    std::string description;
};

struct AppConfig {
    std::string version;
    std::string source_path;
    ServiceInfo service;
    CameraConfig camera;
    PoseConfig pose;
    PostureConfig posture;
    AlertConfig alerts;
    RecoveryConfig recovery;
    WatchdogConfig watchdog;
    MqttConfig mqtt;
    EventStoreConfig event_store;
};

struct Resolution {
    int width = 640;
    int height = 480;
};

// Maps "480p"/"720p"/"1080p" to pixel dimensions. Unknown presets fall back
// to 480p.
Resolution resolutionDimensions(const std::string& preset);
bool isKnownResolution(const std::string& preset);

AppConfig parseConfig(const Json& root, const std::string& base_dir = {});
AppConfig loadConfig(const std::string& path);

// Throws std::runtime_error naming the first invalid field.
void validateConfig(const AppConfig& config);

Json toJson(const AppConfig& config);

}  // namespace posture
