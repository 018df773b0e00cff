#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace posture {

struct PreprocessInfo {
    std::vector<float> input_tensor;   // CHW, RGB, [0, 1]
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
    cv::Mat letterbox;
};

// Resizes keeping aspect ratio and pads with gray (114) to the network input.
PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h);

float IoU(const cv::Rect2f& a, const cv::Rect2f& b);

// Indices of the kept boxes, highest score first.
std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iou_threshold = 0.45f);

std::string base64Encode(const std::uint8_t* data, std::size_t size);
std::string base64Encode(const std::vector<std::uint8_t>& data);

// JPEG-encodes the frame and returns it base64 encoded. Throws
// std::runtime_error when the encoder fails.
std::string encodeJpegBase64(const cv::Mat& frame, int quality = 80);

}  // namespace posture
