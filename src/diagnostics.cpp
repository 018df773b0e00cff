#include "posture/diagnostics.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include <grp.h>
#include <pwd.h>
#include <sys/wait.h>
#include <unistd.h>

namespace posture {
namespace {

constexpr int kMaxCameraIndex = 9;

std::string currentUserName() {
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "$USER";
}

// True when the caller may use video devices without an explicit group
// membership (root, or a system without a "video" group).
bool checkVideoGroupMembership(std::string& error) {
    if (getuid() == 0) {
        return true;
    }
    struct group* video = getgrnam("video");
    if (!video) {
        return true;
    }
    const gid_t video_gid = video->gr_gid;
    if (getgid() == video_gid || getegid() == video_gid) {
        return true;
    }

    struct passwd* pw = getpwuid(getuid());
    if (!pw) {
        error = "Cannot resolve current user";
        return false;
    }

    int count = 64;
    std::vector<gid_t> groups(static_cast<std::size_t>(count));
    if (getgrouplist(pw->pw_name, pw->pw_gid, groups.data(), &count) == -1) {
        groups.resize(static_cast<std::size_t>(count));
        if (getgrouplist(pw->pw_name, pw->pw_gid, groups.data(), &count) == -1) {
            error = "Cannot read group list of user " + std::string(pw->pw_name);
            return false;
        }
    }
    groups.resize(static_cast<std::size_t>(count));
    if (std::find(groups.begin(), groups.end(), video_gid) != groups.end()) {
        return true;
    }
    error = "User " + std::string(pw->pw_name) + " is not in the 'video' group";
    return false;
}

std::string readFirstLine(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::string line;
    if (input) {
        std::getline(input, line);
    }
    return line;
}

std::string groupRemediation() {
    std::string user = currentUserName();
    return "Camera access denied: user not in the 'video' group.\n\n"
           "To fix:\n"
           "1. Run: sudo usermod -aG video " + user + "\n"
           "2. Log out and log back in\n"
           "3. Verify with: groups " + user + "\n"
           "4. Restart the posture monitor\n";
}

std::string unreadableRemediation(const std::string& device) {
    return "Camera access denied: cannot read " + device + ".\n\n"
           "To fix:\n"
           "1. Check permissions: ls -l " + device + "\n"
           "2. Add your user to the 'video' group: sudo usermod -aG video " + currentUserName() + "\n"
           "3. Check udev rules under /etc/udev/rules.d\n"
           "4. Restart the posture monitor\n";
}

std::string notFoundRemediation() {
    return "Camera not found.\n\n"
           "To fix:\n"
           "1. Check the USB connection or try a different port\n"
           "2. Check device exists: ls /dev/video*\n"
           "3. Load the UVC driver: sudo modprobe uvcvideo\n"
           "4. Check kernel messages: dmesg | grep -i video\n"
           "5. For a CSI camera module, enable it and reboot\n";
}

std::string busyRemediation(const std::string& device, const std::string& process, int pid) {
    if (!process.empty() && pid > 0) {
        return "Camera is in use by: " + process + " (PID: " + std::to_string(pid) + ")\n\n"
               "To fix:\n"
               "1. Close " + process + "\n"
               "2. Or stop the process: sudo kill " + std::to_string(pid) + "\n"
               "3. Restart the posture monitor\n";
    }
    return "Camera is in use by another application.\n\n"
           "To fix:\n"
           "1. Check running processes: lsof " + device + "\n"
           "2. Close video applications (browsers, VLC, motion)\n"
           "3. Restart the posture monitor\n";
}

std::string driverRemediation() {
    return "Camera driver malfunction detected.\n\n"
           "To fix:\n"
           "1. Reload the UVC driver: sudo modprobe -r uvcvideo && sudo modprobe uvcvideo\n"
           "2. Check kernel messages: dmesg | tail -30\n"
           "3. Reconnect the camera or reboot if the problem persists\n";
}

std::string genericRemediation() {
    return "Camera error occurred.\n\n"
           "Try these steps:\n"
           "1. Reconnect the camera (if USB)\n"
           "2. Check permissions: groups $USER\n"
           "3. Verify device exists: ls -la /dev/video*\n"
           "4. Check kernel logs: dmesg | tail -20\n";
}

CaptureDiagnostic makeDiagnostic(CaptureFault fault, std::string device, std::string message,
                                 std::string details, std::string remediation) {
    CaptureDiagnostic diagnostic;
    diagnostic.fault = fault;
    diagnostic.device_path = std::move(device);
    diagnostic.message = std::move(message);
    diagnostic.technical_details = std::move(details);
    diagnostic.remediation = std::move(remediation);
    diagnostic.retry_recommended = isRetryRecommended(fault);
    return diagnostic;
}

}  // namespace

const char* captureFaultName(CaptureFault fault) {
    switch (fault) {
    case CaptureFault::PermissionDenied:
        return "permission_denied";
    case CaptureFault::DeviceBusy:
        return "device_busy";
    case CaptureFault::DeviceNotFound:
        return "device_not_found";
    case CaptureFault::DriverMalfunction:
        return "driver_malfunction";
    case CaptureFault::Unknown:
        break;
    }
    return "unknown";
}

bool isRetryRecommended(CaptureFault fault) {
    return fault != CaptureFault::PermissionDenied && fault != CaptureFault::DeviceNotFound;
}

Json toJson(const CaptureDiagnostic& diagnostic) {
    Json obj = Json::object();
    obj["error_type"] = captureFaultName(diagnostic.fault);
    obj["device"] = diagnostic.device_path;
    obj["message"] = diagnostic.message;
    obj["technical_details"] = diagnostic.technical_details;
    obj["remediation"] = diagnostic.remediation;
    obj["retry_recommended"] = diagnostic.retry_recommended;
    if (diagnostic.blocking_process.empty()) {
        obj["blocking_process"] = nullptr;
    } else {
        obj["blocking_process"] = diagnostic.blocking_process;
    }
    return obj;
}

std::string formatDiagnostic(const CaptureDiagnostic& diagnostic) {
    std::ostringstream out;
    out << "Error Type: " << captureFaultName(diagnostic.fault) << "\n"
        << "Device: " << diagnostic.device_path << "\n"
        << "Message: " << diagnostic.message << "\n"
        << "Technical Details: " << diagnostic.technical_details << "\n"
        << "Retry Recommended: " << (diagnostic.retry_recommended ? "yes" : "no") << "\n";
    if (!diagnostic.blocking_process.empty()) {
        out << "Blocking Process: " << diagnostic.blocking_process << " (PID: " << diagnostic.blocking_pid << ")\n";
    }
    out << "\n" << diagnostic.remediation;
    return out.str();
}

std::optional<std::string> probeDriverWithV4l2Ctl(const std::string& device_path) {
    std::string command = "v4l2-ctl -d '" + device_path + "' --all 2>&1";

    int exit_status = -1;
    auto closer = [&exit_status](FILE* f) {
        if (f) {
            exit_status = pclose(f);
        }
    };

    std::string output;
    {
        std::unique_ptr<FILE, decltype(closer)> pipe(popen(command.c_str(), "r"), closer);
        if (!pipe) {
            std::cerr << "[Diagnostics] Failed to run v4l2-ctl" << std::endl;
            return std::nullopt;
        }
        std::array<char, 512> buffer{};
        while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get())) {
            output += buffer.data();
        }
    }

    if (exit_status == -1 || !WIFEXITED(exit_status)) {
        return std::string("v4l2-ctl terminated abnormally");
    }
    int code = WEXITSTATUS(exit_status);
    if (code == 0) {
        return std::nullopt;
    }
    if (code == 127) {
        std::cout << "[Diagnostics] v4l2-ctl not installed, skipping driver check" << std::endl;
        return std::nullopt;
    }

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    auto last_newline = output.rfind('\n');
    std::string last_line = last_newline == std::string::npos ? output : output.substr(last_newline + 1);
    return "v4l2-ctl error (exit " + std::to_string(code) + "): " + last_line;
}

CaptureDiagnostics::CaptureDiagnostics(std::string dev_root, std::string proc_root)
    : dev_root_(std::move(dev_root)), proc_root_(std::move(proc_root)), driver_probe_(probeDriverWithV4l2Ctl) {}

void CaptureDiagnostics::setDriverProbe(DriverProbe probe) {
    driver_probe_ = std::move(probe);
}

std::string CaptureDiagnostics::devicePath(int index) const {
    return (std::filesystem::path(dev_root_) / ("video" + std::to_string(index))).string();
}

PermissionCheck CaptureDiagnostics::checkPermissions() const {
    PermissionCheck check;

    std::string group_error;
    check.video_group_member = checkVideoGroupMembership(group_error);
    if (!check.video_group_member) {
        check.error = group_error;
        check.blocking_fault = CaptureFault::PermissionDenied;
        return check;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dev_root_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("video", 0) == 0) {
            check.devices.push_back(entry.path().string());
        }
    }
    std::sort(check.devices.begin(), check.devices.end());
    check.device_exists = !check.devices.empty();
    if (!check.device_exists) {
        check.error = "No camera devices found (" + dev_root_ + "/video*)";
        check.blocking_fault = CaptureFault::DeviceNotFound;
        return check;
    }

    for (const auto& device : check.devices) {
        if (access(device.c_str(), R_OK) == 0) {
            check.device_readable = true;
            break;
        }
    }
    if (!check.device_readable) {
        check.error = "Camera device not readable: " + check.devices.front();
        check.blocking_fault = CaptureFault::PermissionDenied;
        return check;
    }

    check.accessible = true;
    return check;
}

CaptureDiagnostic CaptureDiagnostics::fromPermissionCheck(int index, const PermissionCheck& check) const {
    std::string device = devicePath(index);
    CaptureFault fault = check.blocking_fault.value_or(CaptureFault::Unknown);
    switch (fault) {
    case CaptureFault::DeviceNotFound:
        return makeDiagnostic(fault, device, check.error, "No video devices detected", notFoundRemediation());
    case CaptureFault::PermissionDenied:
        if (!check.video_group_member) {
            return makeDiagnostic(fault, device, check.error, "Blocking reason: video group", groupRemediation());
        }
        return makeDiagnostic(fault, device, check.error, "Blocking reason: device not readable",
                              unreadableRemediation(check.devices.empty() ? device : check.devices.front()));
    default:
        break;
    }
    return makeDiagnostic(CaptureFault::Unknown, device, check.error, check.error, genericRemediation());
}

std::optional<CaptureDiagnostic> CaptureDiagnostics::preflight(int index) const {
    PermissionCheck check = checkPermissions();
    if (!check.accessible) {
        return fromPermissionCheck(index, check);
    }

    std::string device = devicePath(index);
    std::error_code ec;
    if (!std::filesystem::exists(device, ec)) {
        return makeDiagnostic(CaptureFault::DeviceNotFound, device, "Camera " + device + " not found",
                              "Camera device not detected by Linux", notFoundRemediation());
    }
    if (access(device.c_str(), R_OK) != 0) {
        return makeDiagnostic(CaptureFault::PermissionDenied, device, "Camera device not readable: " + device,
                              "Blocking reason: device not readable", unreadableRemediation(device));
    }
    return std::nullopt;
}

std::optional<CaptureDiagnostics::BlockingProcess>
CaptureDiagnostics::findBlockingProcess(const std::string& device_path) const {
    const std::string self = std::to_string(getpid());
    const std::filesystem::path device(device_path);

    std::error_code ec;
    for (const auto& proc_entry : std::filesystem::directory_iterator(proc_root_, ec)) {
        std::string pid_name = proc_entry.path().filename().string();
        if (pid_name.empty() || !std::all_of(pid_name.begin(), pid_name.end(),
                                                 [](unsigned char c) { return std::isdigit(c) != 0; }) || pid_name == self) {
            continue;
        }

        std::error_code fd_ec;
        for (const auto& fd_entry : std::filesystem::directory_iterator(proc_entry.path() / "fd", fd_ec)) {
            std::error_code link_ec;
            std::filesystem::path target = std::filesystem::read_symlink(fd_entry.path(), link_ec);
            if (link_ec || target != device) {
                continue;
            }
            BlockingProcess process;
            process.pid = std::stoi(pid_name);
            process.name = readFirstLine(proc_entry.path() / "comm");
            if (process.name.empty()) {
                process.name = "pid " + pid_name;
            }
            return process;
        }
    }
    return std::nullopt;
}

CaptureDiagnostic CaptureDiagnostics::diagnose(int index, const std::string& error) const {
    std::string device = devicePath(index);
    std::cout << "[Diagnostics] Diagnosing camera error for " << device << std::endl;

    PermissionCheck check = checkPermissions();
    if (!check.accessible) {
        return fromPermissionCheck(index, check);
    }

    if (auto blocker = findBlockingProcess(device)) {
        CaptureDiagnostic diagnostic =
            makeDiagnostic(CaptureFault::DeviceBusy, device, "Camera is in use by another application",
                           "Blocking process: " + blocker->name + " (PID: " + std::to_string(blocker->pid) + ")",
                           busyRemediation(device, blocker->name, blocker->pid));
        diagnostic.blocking_process = blocker->name;
        diagnostic.blocking_pid = blocker->pid;
        return diagnostic;
    }

    std::error_code ec;
    if (!std::filesystem::exists(device, ec)) {
        return makeDiagnostic(CaptureFault::DeviceNotFound, device, "Camera " + device + " not found",
                              "Camera device not detected by Linux", notFoundRemediation());
    }

    if (driver_probe_) {
        if (auto issue = driver_probe_(device)) {
            return makeDiagnostic(CaptureFault::DriverMalfunction, device, "Camera driver malfunction detected",
                                  *issue, driverRemediation());
        }
    }

    std::string message = error.empty() ? "Unknown camera error" : "Unknown camera error: " + error;
    return makeDiagnostic(CaptureFault::Unknown, device, message, error.empty() ? "No exception details" : error,
                          genericRemediation());
}

std::vector<CameraInfo> CaptureDiagnostics::listCameras() const {
    std::vector<CameraInfo> cameras;
    for (int index = 0; index <= kMaxCameraIndex; ++index) {
        std::string device = devicePath(index);
        std::error_code ec;
        if (!std::filesystem::exists(device, ec)) {
            continue;
        }
        CameraInfo info;
        info.index = index;
        info.device_path = device;
        info.readable = access(device.c_str(), R_OK) == 0;
        cameras.push_back(info);
    }
    return cameras;
}

}  // namespace posture
