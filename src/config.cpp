#include "posture/config.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace posture {
namespace {

std::string resolvePath(const std::string& base_dir, const std::string& path) {
    if (path.empty() || base_dir.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

int getInt(const Json& node, const std::string& key, int fallback) {
    return static_cast<int>(node.get_number(key, fallback));
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("Invalid configuration: " + message);
    }
}

CameraConfig parseCamera(const Json& node) {
    CameraConfig camera;
    camera.device = getInt(node, "device", camera.device);
    camera.fps_target = getInt(node, "fps_target", camera.fps_target);
    camera.resolution = node.get_string("resolution", camera.resolution);
    camera.warmup_frames = getInt(node, "warmup_frames", camera.warmup_frames);
    camera.jpeg_quality = getInt(node, "jpeg_quality", camera.jpeg_quality);
    return camera;
}

PoseConfig parsePose(const Json& node, const std::string& base_dir) {
    PoseConfig pose;
    pose.model_path = resolvePath(base_dir, node.get_string("model_path", pose.model_path));
    pose.model_spec = resolvePath(base_dir, node.get_string("model_spec", pose.model_spec));
    pose.min_detection_confidence = node.get_number("min_detection_confidence", pose.min_detection_confidence);
    pose.min_tracking_confidence = node.get_number("min_tracking_confidence", pose.min_tracking_confidence);
    return pose;
}

AlertConfig parseAlerts(const Json& node) {
    AlertConfig alerts;
    // Older installations configure minutes; seconds win when both exist.
    if (node.contains("posture_threshold_minutes")) {
        int minutes = getInt(node, "posture_threshold_minutes", 10);
        require(minutes >= 1 && minutes <= 60, "alerts.posture_threshold_minutes must be within 1-60");
        alerts.threshold_seconds = minutes * 60;
    }
    if (node.contains("alert_cooldown_minutes")) {
        int minutes = getInt(node, "alert_cooldown_minutes", 5);
        require(minutes >= 1 && minutes <= 30, "alerts.alert_cooldown_minutes must be within 1-30");
        alerts.cooldown_seconds = minutes * 60;
    }
    alerts.threshold_seconds = getInt(node, "threshold_seconds", alerts.threshold_seconds);
    alerts.cooldown_seconds = getInt(node, "cooldown_seconds", alerts.cooldown_seconds);
    return alerts;
}

RecoveryConfig parseRecovery(const Json& node) {
    RecoveryConfig recovery;
    recovery.quick_retries = getInt(node, "quick_retries", recovery.quick_retries);
    recovery.quick_retry_delay_ms = getInt(node, "quick_retry_delay_ms", recovery.quick_retry_delay_ms);
    recovery.long_retry_interval_seconds =
        getInt(node, "long_retry_interval_seconds", recovery.long_retry_interval_seconds);
    recovery.hardware_fault_pause_ms = getInt(node, "hardware_fault_pause_ms", recovery.hardware_fault_pause_ms);
    return recovery;
}

MqttConfig parseMqtt(const Json& node) {
    MqttConfig mqtt;
    mqtt.server = node.get_string("server", mqtt.server);
    mqtt.port = getInt(node, "port", mqtt.port);
    mqtt.client_id = node.get_string("client_id", mqtt.client_id);
    mqtt.username = node.get_string("username", mqtt.username);
    mqtt.password = node.get_string("password", mqtt.password);
    mqtt.control_topic = node.get_string("control_topic", mqtt.control_topic);
    mqtt.event_topic = node.get_string("event_topic", mqtt.event_topic);
    mqtt.snapshot_topic = node.get_string("snapshot_topic", mqtt.snapshot_topic);
    return mqtt;
}

}  // namespace

Resolution resolutionDimensions(const std::string& preset) {
    if (preset == "720p") {
        return {1280, 720};
    }
    if (preset == "1080p") {
        return {1920, 1080};
    }
    return {640, 480};
}

bool isKnownResolution(const std::string& preset) {
    return preset == "480p" || preset == "720p" || preset == "1080p";
}

AppConfig parseConfig(const Json& root, const std::string& base_dir) {
    if (!root.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    AppConfig config;
    config.version = root.get_string("version");

    if (root.contains("service")) {
        const auto& service = root.at("service");
        config.service.name = service.get_string("name", config.service.name);
        config.service.description = service.get_string("description");
    }
    if (root.contains("camera")) {
        config.camera = parseCamera(root.at("camera"));
    }
    if (root.contains("pose")) {
        config.pose = parsePose(root.at("pose"), base_dir);
    } else {
        config.pose.model_path = resolvePath(base_dir, config.pose.model_path);
        config.pose.model_spec = resolvePath(base_dir, config.pose.model_spec);
    }
    if (root.contains("posture")) {
        const auto& node = root.at("posture");
        config.posture.angle_threshold = node.get_number("angle_threshold", config.posture.angle_threshold);
        config.posture.slouch_check = node.get_bool("slouch_check", config.posture.slouch_check);
    }
    if (root.contains("alerts")) {
        config.alerts = parseAlerts(root.at("alerts"));
    }
    if (root.contains("recovery")) {
        config.recovery = parseRecovery(root.at("recovery"));
    }
    if (root.contains("watchdog")) {
        config.watchdog.interval_seconds =
            getInt(root.at("watchdog"), "interval_seconds", config.watchdog.interval_seconds);
    }
    if (root.contains("mqtt")) {
        config.mqtt = parseMqtt(root.at("mqtt"));
    }
    if (root.contains("event_store")) {
        config.event_store.path =
            resolvePath(base_dir, root.at("event_store").get_string("path", config.event_store.path));
    } else {
        config.event_store.path = resolvePath(base_dir, config.event_store.path);
    }

    return config;
}

AppConfig loadConfig(const std::string& path) {
    Json root = Json::parse_file(path);

    std::filesystem::path absolute = std::filesystem::absolute(path).lexically_normal();
    std::string base_dir = absolute.has_parent_path() ? absolute.parent_path().string() : std::string(".");

    AppConfig config = parseConfig(root, base_dir);
    config.source_path = absolute.generic_string();
    validateConfig(config);

    if (!isKnownResolution(config.camera.resolution)) {
        std::cerr << "[Config] Unknown resolution '" << config.camera.resolution
                  << "', valid values: 480p, 720p, 1080p (using 480p)" << std::endl;
    }
    std::cout << "[Config] Loaded " << config.source_path << ": camera=/dev/video" << config.camera.device
              << " fps=" << config.camera.fps_target << " threshold=" << config.alerts.threshold_seconds
              << "s cooldown=" << config.alerts.cooldown_seconds << "s" << std::endl;
    return config;
}

void validateConfig(const AppConfig& config) {
    require(config.camera.device >= 0 && config.camera.device <= 9, "camera.device must be within 0-9");
    require(config.camera.fps_target >= 1 && config.camera.fps_target <= 60, "camera.fps_target must be within 1-60");
    require(config.camera.warmup_frames >= 0, "camera.warmup_frames must not be negative");
    require(config.camera.jpeg_quality >= 1 && config.camera.jpeg_quality <= 100,
            "camera.jpeg_quality must be within 1-100");

    require(config.pose.min_detection_confidence >= 0.0 && config.pose.min_detection_confidence <= 1.0,
            "pose.min_detection_confidence must be within 0-1");
    require(config.pose.min_tracking_confidence >= 0.0 && config.pose.min_tracking_confidence <= 1.0,
            "pose.min_tracking_confidence must be within 0-1");

    require(config.posture.angle_threshold > 0.0 && config.posture.angle_threshold < 90.0,
            "posture.angle_threshold must be within (0, 90) degrees");

    require(config.alerts.threshold_seconds > 0, "alerts.threshold_seconds must be positive");
    require(config.alerts.cooldown_seconds > 0, "alerts.cooldown_seconds must be positive");

    require(config.recovery.quick_retries >= 1, "recovery.quick_retries must be at least 1");
    require(config.recovery.quick_retry_delay_ms >= 0, "recovery.quick_retry_delay_ms must not be negative");
    require(config.recovery.long_retry_interval_seconds >= 1,
            "recovery.long_retry_interval_seconds must be at least 1");
    require(config.recovery.hardware_fault_pause_ms >= 0, "recovery.hardware_fault_pause_ms must not be negative");

    require(config.watchdog.interval_seconds >= 1, "watchdog.interval_seconds must be at least 1");

    require(config.mqtt.port > 0 && config.mqtt.port <= 65535, "mqtt.port must be within 1-65535");
    require(!config.mqtt.username.empty() || config.mqtt.password.empty(),
            "mqtt.password provided without mqtt.username");
}

Json toJson(const AppConfig& config) {
    Json root = Json::object();
    root["version"] = config.version;
    root["service"]["name"] = config.service.name;

    Json& camera = root["camera"];
    camera["device"] = config.camera.device;
    camera["fps_target"] = config.camera.fps_target;
    camera["resolution"] = config.camera.resolution;

    Json& pose = root["pose"];
    pose["model_path"] = config.pose.model_path;
    pose["min_detection_confidence"] = config.pose.min_detection_confidence;
    pose["min_tracking_confidence"] = config.pose.min_tracking_confidence;

    root["posture"]["angle_threshold"] = config.posture.angle_threshold;
    root["posture"]["slouch_check"] = config.posture.slouch_check;
    root["alerts"]["threshold_seconds"] = config.alerts.threshold_seconds;
    root["alerts"]["cooldown_seconds"] = config.alerts.cooldown_seconds;

    Json& mqtt = root["mqtt"];
    mqtt["server"] = config.mqtt.server;
    mqtt["port"] = config.mqtt.port;
    mqtt["client_id"] = config.mqtt.client_id;
    mqtt["control_topic"] = config.mqtt.control_topic;
    mqtt["event_topic"] = config.mqtt.event_topic;
    mqtt["snapshot_topic"] = config.mqtt.snapshot_topic;
    return root;
}

}  // namespace posture
