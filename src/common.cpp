#include "posture/common.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace posture {

PreprocessInfo preprocessLetterbox(const cv::Mat& img, int input_w, int input_h)
{
    if (img.empty() || img.channels() != 3) {
        throw std::runtime_error("Letterbox input must be a non-empty 3-channel image");
    }

    int img_w = img.cols;
    int img_h = img.rows;

    float scale = std::min(static_cast<float>(input_w) / img_w, static_cast<float>(input_h) / img_h);

    int new_w = static_cast<int>(img_w * scale);
    int new_h = static_cast<int>(img_h * scale);

    cv::Mat resized;
    cv::resize(img, resized, cv::Size(new_w, new_h));

    int pad_x = (input_w - new_w) / 2;
    int pad_y = (input_h - new_h) / 2;

    cv::Mat letterbox(input_h, input_w, img.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(letterbox(cv::Rect(pad_x, pad_y, new_w, new_h)));

    cv::Mat rgb;
    cv::cvtColor(letterbox, rgb, cv::COLOR_BGR2RGB);

    cv::Mat float_img;
    rgb.convertTo(float_img, CV_32F, 1.0 / 255.0);
    std::vector<cv::Mat> chw(3);
    cv::split(float_img, chw);

    PreprocessInfo info;
    info.input_tensor.reserve(static_cast<std::size_t>(input_w) * input_h * 3);
    for (int c = 0; c < 3; ++c) {
        const float* begin = chw[c].ptr<float>();
        info.input_tensor.insert(info.input_tensor.end(), begin, begin + chw[c].total());
    }
    info.scale = scale;
    info.pad_x = pad_x;
    info.pad_y = pad_y;
    info.letterbox = letterbox;
    return info;
}

float IoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    float inter_area = (a & b).area();
    float union_area = a.area() + b.area() - inter_area;
    if (union_area <= 0.0f) {
        return 0.0f;
    }
    return inter_area / union_area;
}

std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iou_threshold) {
    std::vector<int> indices;
    std::vector<int> order(boxes.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](int i, int j) { return scores[i] > scores[j]; });

    std::vector<bool> suppressed(boxes.size(), false);
    for (std::size_t i = 0; i < order.size(); i++) {
        int idx = order[i];
        if (suppressed[idx]) continue;
        indices.push_back(idx);
        for (std::size_t j = i + 1; j < order.size(); j++) {
            int idx2 = order[j];
            if (IoU(boxes[idx], boxes[idx2]) > iou_threshold)
                suppressed[idx2] = true;
        }
    }
    return indices;
}

std::string base64Encode(const std::uint8_t* data, std::size_t size) {
    static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < size; i += 3) {
        std::uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }
    if (i < size) {
        std::uint32_t triple = data[i] << 16;
        if (i + 1 < size) {
            triple |= data[i + 1] << 8;
        }
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(i + 1 < size ? kAlphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::string base64Encode(const std::vector<std::uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

std::string encodeJpegBase64(const cv::Mat& frame, int quality) {
    if (frame.empty()) {
        throw std::runtime_error("Cannot encode an empty frame");
    }
    std::vector<std::uint8_t> buffer;
    std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
    if (!cv::imencode(".jpg", frame, buffer, params)) {
        throw std::runtime_error("JPEG encoding failed");
    }
    return base64Encode(buffer);
}

}  // namespace posture
