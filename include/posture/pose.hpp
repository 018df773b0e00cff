#pragma once

#include <memory>
#include <optional>

#include <opencv2/core.hpp>

#include "posture/landmarks.hpp"

namespace posture {

enum class DetectionKind { Detected, NoPerson, InvalidFrame };

const char* detectionKindName(DetectionKind kind);

struct PoseDetection {
    DetectionKind kind = DetectionKind::InvalidFrame;
    std::optional<LandmarkSet> landmarks;
    bool user_present = false;
    double confidence = 0.0;

    static PoseDetection invalidFrame();
    static PoseDetection noPerson();
    static PoseDetection detected(LandmarkSet landmarks, double confidence);
};

// One person as seen by the inference engine, landmarks normalized to the
// frame size.
struct PoseEstimate {
    LandmarkSet landmarks;
    float score = 0.0f;
    cv::Rect2f box;
};

class PoseEngine {
public:
    virtual ~PoseEngine() = default;

    // Most confident person above the engine's detection threshold, or
    // nullopt when nobody is in view. Failures are thrown.
    virtual std::optional<PoseEstimate> infer(const cv::Mat& frame) = 0;
    virtual const KeypointLayout& layout() const = 0;
};

class PoseEstimator {
public:
    explicit PoseEstimator(std::unique_ptr<PoseEngine> engine, double min_tracking_confidence = 0.5);

    // Empty or non-BGR frames never reach the engine. Engine exceptions
    // propagate to the caller.
    PoseDetection detect(const cv::Mat& frame);

    // Draws keypoints and limbs in place. Landmarks below the tracking
    // confidence are skipped; nullopt leaves the frame untouched.
    cv::Mat& renderOverlay(cv::Mat& frame, const std::optional<LandmarkSet>& landmarks, const Color& color) const;

    const KeypointLayout& layout() const { return engine_->layout(); }

private:
    std::unique_ptr<PoseEngine> engine_;
    double min_tracking_confidence_;
};

}  // namespace posture
