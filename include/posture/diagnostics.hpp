#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "posture/json.hpp"

namespace posture {

enum class CaptureFault { PermissionDenied, DeviceBusy, DeviceNotFound, DriverMalfunction, Unknown };

const char* captureFaultName(CaptureFault fault);

// permission_denied and device_not_found need operator action; everything
// else is handed to the camera health state machine.
bool isRetryRecommended(CaptureFault fault);

struct CaptureDiagnostic {
    CaptureFault fault = CaptureFault::Unknown;
    std::string device_path;
    std::string message;
    std::string technical_details;
    std::string remediation;
    bool retry_recommended = true;
    std::string blocking_process;
    int blocking_pid = 0;
};

Json toJson(const CaptureDiagnostic& diagnostic);
std::string formatDiagnostic(const CaptureDiagnostic& diagnostic);

struct PermissionCheck {
    bool video_group_member = false;
    bool device_exists = false;
    bool device_readable = false;
    bool accessible = false;
    std::string error;
    std::optional<CaptureFault> blocking_fault;
    std::vector<std::string> devices;
};

struct CameraInfo {
    int index = 0;
    std::string device_path;
    bool readable = false;
};

// Linux V4L2 capture troubleshooting. Device and process tables are read
// from configurable roots so the checks can run against a fixture tree.
class CaptureDiagnostics {
public:
    // Returns a problem description for the device, or nullopt when the
    // driver looks healthy.
    using DriverProbe = std::function<std::optional<std::string>(const std::string& device_path)>;

    explicit CaptureDiagnostics(std::string dev_root = "/dev", std::string proc_root = "/proc");

    void setDriverProbe(DriverProbe probe);

    std::string devicePath(int index) const;

    // video group, /dev/video* presence, readability.
    PermissionCheck checkPermissions() const;

    // Pre-flight check before opening the device; nullopt when accessible.
    std::optional<CaptureDiagnostic> preflight(int index) const;

    // Full diagnosis after a failed open: permissions, busy, presence, driver.
    CaptureDiagnostic diagnose(int index, const std::string& error = {}) const;

    std::vector<CameraInfo> listCameras() const;

private:
    struct BlockingProcess {
        int pid = 0;
        std::string name;
    };

    std::optional<BlockingProcess> findBlockingProcess(const std::string& device_path) const;
    CaptureDiagnostic fromPermissionCheck(int index, const PermissionCheck& check) const;

    std::string dev_root_;
    std::string proc_root_;
    DriverProbe driver_probe_;
};

// Runs `v4l2-ctl -d <device> --all`. A missing tool is not a driver fault.
std::optional<std::string> probeDriverWithV4l2Ctl(const std::string& device_path);

}  // namespace posture
