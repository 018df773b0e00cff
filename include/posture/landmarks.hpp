#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace posture {

enum class Posture { Good, Bad, Unknown };

const char* postureName(Posture posture);

struct Landmark {
    float x = 0.0f;          // normalized to image width
    float y = 0.0f;          // normalized to image height
    float z = 0.0f;
    float visibility = 0.0f;
    float presence = 0.0f;
};

using LandmarkSet = std::vector<Landmark>;

// BGR, as consumed by the overlay renderer.
struct Color {
    int b = 0;
    int g = 0;
    int r = 0;

    bool operator==(const Color& other) const {
        return b == other.b && g == other.g && r == other.r;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Named keypoint indices of a pose model. Defaults to the COCO 17-keypoint
// layout used by YOLO pose models.
struct KeypointLayout {
    std::vector<std::string> names;
    int nose = 0;
    int left_shoulder = 5;
    int right_shoulder = 6;
    int left_hip = 11;
    int right_hip = 12;

    static KeypointLayout coco17();

    // Resolves the indices the classifier needs. Throws std::runtime_error if
    // one of them is missing from the list.
    static KeypointLayout fromNames(std::vector<std::string> keypoint_names);

    std::optional<int> indexOf(const std::string& name) const;
    std::size_t size() const { return names.size(); }
};

}  // namespace posture
