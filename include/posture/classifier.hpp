#pragma once

#include <optional>

#include "posture/landmarks.hpp"

namespace posture {

struct PostureMeasurement {
    double torso_angle = 0.0;              // shoulder midpoint vs hip midpoint, degrees
    std::optional<double> neck_angle;      // nose vs shoulder midpoint, only with slouch check
};

// Pure geometry over a landmark set. Never throws: absent or malformed input
// classifies as Posture::Unknown.
class PostureClassifier {
public:
    explicit PostureClassifier(double angle_threshold = 15.0,
                               bool slouch_check = false,
                               KeypointLayout layout = KeypointLayout::coco17());

    Posture classify(const std::optional<LandmarkSet>& landmarks) const noexcept;
    std::optional<PostureMeasurement> measure(const std::optional<LandmarkSet>& landmarks) const noexcept;

    double angleThreshold() const noexcept { return angle_threshold_; }

    // good -> green, bad -> amber, unknown -> gray. Bad posture is never
    // drawn in red.
    static Color displayColor(Posture posture) noexcept;

private:
    double angle_threshold_;
    bool slouch_check_;
    KeypointLayout layout_;
};

}  // namespace posture
