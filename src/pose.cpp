#include "posture/pose.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace posture {
namespace {

const std::array<std::pair<const char*, const char*>, 16> kSkeleton{{
    {"nose", "left_eye"},
    {"nose", "right_eye"},
    {"left_eye", "left_ear"},
    {"right_eye", "right_ear"},
    {"left_shoulder", "right_shoulder"},
    {"left_shoulder", "left_elbow"},
    {"left_elbow", "left_wrist"},
    {"right_shoulder", "right_elbow"},
    {"right_elbow", "right_wrist"},
    {"left_shoulder", "left_hip"},
    {"right_shoulder", "right_hip"},
    {"left_hip", "right_hip"},
    {"left_hip", "left_knee"},
    {"left_knee", "left_ankle"},
    {"right_hip", "right_knee"},
    {"right_knee", "right_ankle"},
}};

}  // namespace

const char* detectionKindName(DetectionKind kind) {
    switch (kind) {
    case DetectionKind::Detected:
        return "detected";
    case DetectionKind::NoPerson:
        return "no_person";
    case DetectionKind::InvalidFrame:
        break;
    }
    return "invalid_frame";
}

PoseDetection PoseDetection::invalidFrame() {
    return PoseDetection{};
}

PoseDetection PoseDetection::noPerson() {
    PoseDetection detection;
    detection.kind = DetectionKind::NoPerson;
    return detection;
}

PoseDetection PoseDetection::detected(LandmarkSet landmarks, double confidence) {
    PoseDetection detection;
    detection.kind = DetectionKind::Detected;
    detection.landmarks = std::move(landmarks);
    detection.user_present = true;
    detection.confidence = confidence;
    return detection;
}

PoseEstimator::PoseEstimator(std::unique_ptr<PoseEngine> engine, double min_tracking_confidence)
    : engine_(std::move(engine)), min_tracking_confidence_(min_tracking_confidence) {
    if (!engine_) {
        throw std::invalid_argument("Pose engine must not be null");
    }
}

PoseDetection PoseEstimator::detect(const cv::Mat& frame) {
    if (frame.empty() || frame.type() != CV_8UC3) {
        return PoseDetection::invalidFrame();
    }

    std::optional<PoseEstimate> estimate = engine_->infer(frame);
    if (!estimate || estimate->landmarks.empty()) {
        return PoseDetection::noPerson();
    }

    // The nose is the most consistently visible keypoint for a seated user.
    double confidence = 0.0;
    int nose = engine_->layout().nose;
    if (nose >= 0 && static_cast<std::size_t>(nose) < estimate->landmarks.size()) {
        confidence = estimate->landmarks[static_cast<std::size_t>(nose)].visibility;
    }
    return PoseDetection::detected(std::move(estimate->landmarks), confidence);
}

cv::Mat& PoseEstimator::renderOverlay(cv::Mat& frame, const std::optional<LandmarkSet>& landmarks,
                                      const Color& color) const {
    if (!landmarks || frame.empty()) {
        return frame;
    }

    const cv::Scalar scalar(color.b, color.g, color.r);
    const KeypointLayout& keypoints = engine_->layout();

    auto visiblePoint = [&](int index, cv::Point& out) {
        if (index < 0 || static_cast<std::size_t>(index) >= landmarks->size()) {
            return false;
        }
        const Landmark& lm = (*landmarks)[static_cast<std::size_t>(index)];
        if (lm.visibility < min_tracking_confidence_) {
            return false;
        }
        out = cv::Point(static_cast<int>(lm.x * frame.cols), static_cast<int>(lm.y * frame.rows));
        return true;
    };

    for (const auto& limb : kSkeleton) {
        auto from = keypoints.indexOf(limb.first);
        auto to = keypoints.indexOf(limb.second);
        cv::Point a;
        cv::Point b;
        if (from && to && visiblePoint(*from, a) && visiblePoint(*to, b)) {
            cv::line(frame, a, b, scalar, 2, cv::LINE_AA);
        }
    }

    for (std::size_t i = 0; i < landmarks->size(); ++i) {
        cv::Point p;
        if (visiblePoint(static_cast<int>(i), p)) {
            cv::circle(frame, p, 4, scalar, cv::FILLED, cv::LINE_AA);
        }
    }
    return frame;
}

}  // namespace posture
