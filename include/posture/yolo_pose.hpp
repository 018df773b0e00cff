#pragma once

#include <memory>
#include <optional>
#include <string>

#include "posture/pose.hpp"

namespace posture {

// Metadata shipped next to the ONNX file.
struct PoseModelSpec {
    std::string name = "yolo-pose";
    int input_width = 640;
    int input_height = 640;
    int keypoint_dims = 3;   // x, y, visibility
    float iou_threshold = 0.45f;
    KeypointLayout layout = KeypointLayout::coco17();

    // Throws std::runtime_error on unreadable or inconsistent files.
    static PoseModelSpec load(const std::string& yaml_path);
};

// YOLO pose model on ONNX Runtime. Output layout [1, 4 + 1 + K * dims, N].
class YoloPoseEngine : public PoseEngine {
public:
    YoloPoseEngine(std::string model_path, PoseModelSpec spec, float min_detection_confidence);
    ~YoloPoseEngine() override;

    // Throws std::runtime_error when the session cannot be created.
    void load();
    bool isLoaded() const noexcept { return loaded_; }
    const std::string& path() const noexcept { return model_path_; }

    std::optional<PoseEstimate> infer(const cv::Mat& frame) override;
    const KeypointLayout& layout() const override { return spec_.layout; }

private:
    struct Impl;

    std::string model_path_;
    PoseModelSpec spec_;
    float min_detection_confidence_;
    bool loaded_ = false;
    std::unique_ptr<Impl> impl_;
};

}  // namespace posture
