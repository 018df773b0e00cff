#include "posture/landmarks.hpp"

#include <stdexcept>
#include <utility>

namespace posture {

const char* postureName(Posture posture) {
    switch (posture) {
    case Posture::Good:
        return "good";
    case Posture::Bad:
        return "bad";
    case Posture::Unknown:
        break;
    }
    return "unknown";
}

KeypointLayout KeypointLayout::coco17() {
    return fromNames({"nose",           "left_eye",      "right_eye",   "left_ear",    "right_ear",
                      "left_shoulder",  "right_shoulder", "left_elbow", "right_elbow", "left_wrist",
                      "right_wrist",    "left_hip",      "right_hip",   "left_knee",   "right_knee",
                      "left_ankle",     "right_ankle"});
}

KeypointLayout KeypointLayout::fromNames(std::vector<std::string> keypoint_names) {
    KeypointLayout layout;
    layout.names = std::move(keypoint_names);

    auto resolve = [&layout](const std::string& name) {
        auto index = layout.indexOf(name);
        if (!index) {
            throw std::runtime_error("Pose model keypoints do not include '" + name + "'");
        }
        return *index;
    };

    layout.nose = resolve("nose");
    layout.left_shoulder = resolve("left_shoulder");
    layout.right_shoulder = resolve("right_shoulder");
    layout.left_hip = resolve("left_hip");
    layout.right_hip = resolve("right_hip");
    return layout;
}

std::optional<int> KeypointLayout::indexOf(const std::string& name) const {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

}  // namespace posture
