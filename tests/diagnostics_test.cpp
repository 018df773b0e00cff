#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "posture/diagnostics.hpp"
#include "test_helpers.hpp"

namespace posture {
namespace {

namespace fs = std::filesystem;

// Fake /dev and /proc trees.
class CaptureDiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(dev());
        fs::create_directories(proc());
    }

    fs::path dev() const { return root.path() / "dev"; }
    fs::path proc() const { return root.path() / "proc"; }

    void addDevice(const std::string& name) {
        std::ofstream(dev() / name) << "";
    }

    void addProcess(int pid, const std::string& comm, const fs::path& open_file) {
        fs::path dir = proc() / std::to_string(pid);
        fs::create_directories(dir / "fd");
        std::ofstream(dir / "comm") << comm << "\n";
        fs::create_symlink(open_file, dir / "fd" / "3");
    }

    CaptureDiagnostics makeDiagnostics(std::optional<std::string> driver_issue = std::nullopt) {
        CaptureDiagnostics diagnostics(dev().string(), proc().string());
        diagnostics.setDriverProbe([driver_issue](const std::string&) { return driver_issue; });
        return diagnostics;
    }

    bool groupCheckPasses() { return makeDiagnostics().checkPermissions().video_group_member; }

    testing::TempDir root;
};

TEST_F(CaptureDiagnosticsTest, NoDevicesIsNotFound) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    auto diagnostic = makeDiagnostics().preflight(0);
    ASSERT_TRUE(diagnostic.has_value());
    EXPECT_EQ(diagnostic->fault, CaptureFault::DeviceNotFound);
    EXPECT_FALSE(diagnostic->retry_recommended);
    EXPECT_NE(diagnostic->remediation.find("modprobe uvcvideo"), std::string::npos);
}

TEST_F(CaptureDiagnosticsTest, ConfiguredIndexMissing) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video1");
    auto diagnostic = makeDiagnostics().preflight(0);
    ASSERT_TRUE(diagnostic.has_value());
    EXPECT_EQ(diagnostic->fault, CaptureFault::DeviceNotFound);
    EXPECT_EQ(diagnostic->device_path, (dev() / "video0").string());
}

TEST_F(CaptureDiagnosticsTest, AccessibleDevicePassesPreflight) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video0");
    EXPECT_FALSE(makeDiagnostics().preflight(0).has_value());

    PermissionCheck check = makeDiagnostics().checkPermissions();
    EXPECT_TRUE(check.accessible);
    EXPECT_TRUE(check.device_exists);
    EXPECT_TRUE(check.device_readable);
    ASSERT_EQ(check.devices.size(), 1u);
}

TEST_F(CaptureDiagnosticsTest, BusyDeviceNamesBlockingProcess) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video0");
    addProcess(999999, "zoom", dev() / "video0");

    CaptureDiagnostic diagnostic = makeDiagnostics().diagnose(0, "open failed");
    EXPECT_EQ(diagnostic.fault, CaptureFault::DeviceBusy);
    EXPECT_TRUE(diagnostic.retry_recommended);
    EXPECT_EQ(diagnostic.blocking_process, "zoom");
    EXPECT_EQ(diagnostic.blocking_pid, 999999);
    EXPECT_NE(diagnostic.remediation.find("kill 999999"), std::string::npos);
}

TEST_F(CaptureDiagnosticsTest, OtherOpenFilesAreNotBlocking) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video0");
    addDevice("video1");
    addProcess(999998, "vlc", dev() / "video1");

    CaptureDiagnostic diagnostic = makeDiagnostics().diagnose(0);
    EXPECT_EQ(diagnostic.fault, CaptureFault::Unknown);
    EXPECT_TRUE(diagnostic.blocking_process.empty());
}

TEST_F(CaptureDiagnosticsTest, DriverProbeReportsMalfunction) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video0");
    CaptureDiagnostic diagnostic = makeDiagnostics(std::string("VIDIOC_QUERYCAP: failed")).diagnose(0);
    EXPECT_EQ(diagnostic.fault, CaptureFault::DriverMalfunction);
    EXPECT_TRUE(diagnostic.retry_recommended);
    EXPECT_EQ(diagnostic.technical_details, "VIDIOC_QUERYCAP: failed");
}

TEST_F(CaptureDiagnosticsTest, UnknownCarriesOpenError) {
    if (!groupCheckPasses()) {
        GTEST_SKIP() << "current user lacks video group membership";
    }
    addDevice("video0");
    CaptureDiagnostic diagnostic = makeDiagnostics().diagnose(0, "select timeout");
    EXPECT_EQ(diagnostic.fault, CaptureFault::Unknown);
    EXPECT_TRUE(diagnostic.retry_recommended);
    EXPECT_NE(diagnostic.message.find("select timeout"), std::string::npos);
}

TEST_F(CaptureDiagnosticsTest, ListCamerasScansIndexes) {
    addDevice("video0");
    addDevice("video2");
    addDevice("video12");
    auto cameras = makeDiagnostics().listCameras();
    ASSERT_EQ(cameras.size(), 2u);
    EXPECT_EQ(cameras[0].index, 0);
    EXPECT_EQ(cameras[1].index, 2);
    EXPECT_EQ(cameras[1].device_path, (dev() / "video2").string());
}

TEST(CaptureFaultTest, RetryEligibility) {
    EXPECT_FALSE(isRetryRecommended(CaptureFault::PermissionDenied));
    EXPECT_FALSE(isRetryRecommended(CaptureFault::DeviceNotFound));
    EXPECT_TRUE(isRetryRecommended(CaptureFault::DeviceBusy));
    EXPECT_TRUE(isRetryRecommended(CaptureFault::DriverMalfunction));
    EXPECT_TRUE(isRetryRecommended(CaptureFault::Unknown));
}

TEST(CaptureFaultTest, JsonAndTextForms) {
    CaptureDiagnostic diagnostic;
    diagnostic.fault = CaptureFault::DeviceBusy;
    diagnostic.device_path = "/dev/video0";
    diagnostic.message = "Camera is in use by another application";
    diagnostic.blocking_process = "zoom";
    diagnostic.blocking_pid = 42;

    Json json = toJson(diagnostic);
    EXPECT_EQ(json.at("error_type").as_string(), "device_busy");
    EXPECT_EQ(json.at("device").as_string(), "/dev/video0");
    EXPECT_EQ(json.at("blocking_process").as_string(), "zoom");
    EXPECT_TRUE(json.at("retry_recommended").as_bool());

    std::string text = formatDiagnostic(diagnostic);
    EXPECT_NE(text.find("Error Type: device_busy"), std::string::npos);
    EXPECT_NE(text.find("PID: 42"), std::string::npos);

    diagnostic.blocking_process.clear();
    EXPECT_TRUE(toJson(diagnostic).at("blocking_process").is_null());
}

}  // namespace
}  // namespace posture
