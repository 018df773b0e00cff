#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <random>
#include <string>

#include "posture/landmarks.hpp"

namespace posture {
namespace testing {

// Manually advanced clock for the alert tracker.
struct FakeClock {
    double now = 0.0;
    std::function<double()> fn() {
        return [this]() { return now; };
    }
};

// COCO-17 landmark set with the shoulders above the hips. lean_dx shifts the
// shoulders horizontally; nose_dx shifts the nose relative to the shoulders.
inline LandmarkSet makePose(double lean_dx = 0.0, double nose_dx = 0.0, float visibility = 0.9f) {
    LandmarkSet lms(17);
    for (auto& lm : lms) {
        lm.x = 0.5f;
        lm.y = 0.5f;
        lm.visibility = visibility;
        lm.presence = visibility;
    }
    const float sx = static_cast<float>(0.5 + lean_dx);
    lms[5] = {sx - 0.1f, 0.4f, 0.0f, visibility, visibility};
    lms[6] = {sx + 0.1f, 0.4f, 0.0f, visibility, visibility};
    lms[11] = {0.4f, 0.8f, 0.0f, visibility, visibility};
    lms[12] = {0.6f, 0.8f, 0.0f, visibility, visibility};
    lms[0] = {static_cast<float>(sx + nose_dx), 0.2f, 0.0f, visibility, visibility};
    return lms;
}

// Unique scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("posture_test_" + std::to_string(rd()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

}  // namespace testing
}  // namespace posture
