#include "posture/classifier.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace posture {
namespace {

constexpr double kRadiansToDegrees = 180.0 / 3.14159265358979323846;

struct Point {
    double x = 0.0;
    double y = 0.0;
};

Point pointAt(const LandmarkSet& landmarks, int index) {
    if (index < 0) {
        throw std::out_of_range("negative landmark index");
    }
    const Landmark& lm = landmarks.at(static_cast<std::size_t>(index));
    if (!std::isfinite(lm.x) || !std::isfinite(lm.y)) {
        throw std::domain_error("landmark coordinates are not finite");
    }
    return {lm.x, lm.y};
}

Point midpoint(const Point& a, const Point& b) {
    return {(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}

// Angle from vertical of the segment lower -> upper in image coordinates
// (y grows downwards).
double angleFromVertical(const Point& upper, const Point& lower) {
    double dx = upper.x - lower.x;
    double dy = lower.y - upper.y;
    return std::atan2(dx, dy) * kRadiansToDegrees;
}

}  // namespace

PostureClassifier::PostureClassifier(double angle_threshold, bool slouch_check, KeypointLayout layout)
    : angle_threshold_(angle_threshold), slouch_check_(slouch_check), layout_(std::move(layout)) {}

std::optional<PostureMeasurement> PostureClassifier::measure(const std::optional<LandmarkSet>& landmarks) const noexcept {
    if (!landmarks) {
        return std::nullopt;
    }
    try {
        Point shoulder_mid = midpoint(pointAt(*landmarks, layout_.left_shoulder),
                                      pointAt(*landmarks, layout_.right_shoulder));
        Point hip_mid = midpoint(pointAt(*landmarks, layout_.left_hip), pointAt(*landmarks, layout_.right_hip));

        PostureMeasurement measurement;
        measurement.torso_angle = angleFromVertical(shoulder_mid, hip_mid);
        if (slouch_check_) {
            measurement.neck_angle = angleFromVertical(pointAt(*landmarks, layout_.nose), shoulder_mid);
        }
        return measurement;
    } catch (const std::exception& ex) {
        std::cerr << "[Classifier] Malformed landmarks: " << ex.what() << std::endl;
        return std::nullopt;
    }
}

Posture PostureClassifier::classify(const std::optional<LandmarkSet>& landmarks) const noexcept {
    auto measurement = measure(landmarks);
    if (!measurement) {
        return Posture::Unknown;
    }
    if (std::fabs(measurement->torso_angle) > angle_threshold_) {
        return Posture::Bad;
    }
    if (measurement->neck_angle && std::fabs(*measurement->neck_angle) > angle_threshold_) {
        return Posture::Bad;
    }
    return Posture::Good;
}

Color PostureClassifier::displayColor(Posture posture) noexcept {
    switch (posture) {
    case Posture::Good:
        return {0, 255, 0};
    case Posture::Bad:
        return {0, 191, 255};
    case Posture::Unknown:
        break;
    }
    return {128, 128, 128};
}

}  // namespace posture
