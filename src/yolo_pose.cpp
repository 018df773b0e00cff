#include "posture/yolo_pose.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>
#include <yaml-cpp/yaml.h>

#include "posture/common.hpp"

namespace posture {

PoseModelSpec PoseModelSpec::load(const std::string& yaml_path) {
    YAML::Node data;
    try {
        data = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to parse pose model spec " + yaml_path + ": " + ex.what());
    }

    PoseModelSpec spec;
    try {
        if (data["name"]) {
            spec.name = data["name"].as<std::string>();
        }
        if (data["imgsz"]) {
            const YAML::Node& imgsz = data["imgsz"];
            if (imgsz.IsSequence() && imgsz.size() == 2) {
                spec.input_height = imgsz[0].as<int>();
                spec.input_width = imgsz[1].as<int>();
            } else {
                spec.input_width = spec.input_height = imgsz.as<int>();
            }
        }
        if (data["iou_threshold"]) {
            spec.iou_threshold = data["iou_threshold"].as<float>();
        }
        if (data["keypoints"]) {
            std::vector<std::string> names;
            for (const auto& name : data["keypoints"]) {
                names.push_back(name.as<std::string>());
            }
            spec.layout = KeypointLayout::fromNames(std::move(names));
        } else {
            std::cerr << "[Pose] 'keypoints' not found in " << yaml_path << ", using COCO layout" << std::endl;
        }
        if (data["kpt_shape"]) {
            const YAML::Node& shape = data["kpt_shape"];
            if (!shape.IsSequence() || shape.size() != 2) {
                throw std::runtime_error("kpt_shape must be [count, dims]");
            }
            std::size_t count = shape[0].as<std::size_t>();
            spec.keypoint_dims = shape[1].as<int>();
            if (count != spec.layout.size()) {
                throw std::runtime_error("kpt_shape declares " + std::to_string(count) + " keypoints but " +
                                         std::to_string(spec.layout.size()) + " are named");
            }
        }
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Invalid pose model spec " + yaml_path + ": " + ex.what());
    }

    if (spec.keypoint_dims != 2 && spec.keypoint_dims != 3) {
        throw std::runtime_error("Unsupported keypoint dimensions: " + std::to_string(spec.keypoint_dims));
    }
    if (spec.input_width <= 0 || spec.input_height <= 0) {
        throw std::runtime_error("Pose model input size must be positive");
    }
    return spec;
}

struct YoloPoseEngine::Impl {
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "posture-monitor") {
        session_options.SetIntraOpNumThreads(1);
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char*> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char*> output_name_ptrs;
    std::vector<int64_t> input_shape{1, 3, 640, 640};
};

YoloPoseEngine::YoloPoseEngine(std::string model_path, PoseModelSpec spec, float min_detection_confidence)
    : model_path_(std::move(model_path)),
      spec_(std::move(spec)),
      min_detection_confidence_(min_detection_confidence),
      impl_(std::make_unique<Impl>()) {
    impl_->input_shape = {1, 3, spec_.input_height, spec_.input_width};
}

YoloPoseEngine::~YoloPoseEngine() = default;

void YoloPoseEngine::load() {
    if (!std::filesystem::exists(model_path_)) {
        throw std::runtime_error("Pose model not found: " + model_path_);
    }

    try {
        impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path_.c_str(), impl_->session_options);

        impl_->input_names = impl_->session->GetInputNames();
        impl_->input_name_ptrs.clear();
        for (const auto& name : impl_->input_names) {
            impl_->input_name_ptrs.push_back(name.c_str());
        }

        impl_->output_names = impl_->session->GetOutputNames();
        impl_->output_name_ptrs.clear();
        for (const auto& name : impl_->output_names) {
            impl_->output_name_ptrs.push_back(name.c_str());
        }

        if (impl_->input_names.empty() || impl_->output_names.empty()) {
            throw std::runtime_error("Pose model has no inputs or outputs");
        }

        Ort::TypeInfo type_info = impl_->session->GetInputTypeInfo(0);
        auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
        std::vector<int64_t> shape = tensor_info.GetShape();
        if (shape.size() == 4) {
            // Dynamic axes keep the size from the model spec.
            if (shape[2] > 0) {
                impl_->input_shape[2] = shape[2];
            }
            if (shape[3] > 0) {
                impl_->input_shape[3] = shape[3];
            }
        }
    } catch (const Ort::Exception& ex) {
        impl_->session.reset();
        throw std::runtime_error("Failed to load pose model " + model_path_ + ": " + ex.what());
    }

    loaded_ = true;
    std::cout << "[Pose] Loaded " << spec_.name << " from " << model_path_ << " (input "
              << impl_->input_shape[3] << "x" << impl_->input_shape[2] << ", " << spec_.layout.size()
              << " keypoints)" << std::endl;
}

std::optional<PoseEstimate> YoloPoseEngine::infer(const cv::Mat& image) {
    if (!loaded_ || !impl_->session) {
        throw std::runtime_error("Pose model is not loaded");
    }

    const int real_height = static_cast<int>(impl_->input_shape[2]);
    const int real_width = static_cast<int>(impl_->input_shape[3]);

    auto prep = preprocessLetterbox(image, real_width, real_height);

    std::array<int64_t, 4> input_shape{1, 3, real_height, real_width};
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

    Ort::Value input_tensor_val = Ort::Value::CreateTensor<float>(
        mem_info, prep.input_tensor.data(), prep.input_tensor.size(),
        input_shape.data(), input_shape.size()
    );

    auto outputs = impl_->session->Run(
        Ort::RunOptions{},
        impl_->input_name_ptrs.data(), &input_tensor_val, 1,
        impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size()
    );

    if (outputs.empty() || !outputs.front().IsTensor()) {
        throw std::runtime_error("Pose model produced no tensor output");
    }

    auto& output = outputs.front();
    std::vector<int64_t> shape = output.GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3 || shape[0] != 1) {
        throw std::runtime_error("Unexpected pose output rank");
    }

    const int C = static_cast<int>(shape[1]);
    const int N = static_cast<int>(shape[2]);
    const int K = static_cast<int>(spec_.layout.size());
    const int dims = spec_.keypoint_dims;
    if (C != 5 + K * dims) {
        throw std::runtime_error("Pose output has " + std::to_string(C) + " attributes, expected " +
                                 std::to_string(5 + K * dims));
    }

    const float* data = output.GetTensorData<float>();
    auto get_at = [&](int attr_idx, int i_box) -> float {
        return data[attr_idx * N + i_box];
    };

    const float img_w = static_cast<float>(image.cols);
    const float img_h = static_cast<float>(image.rows);

    std::vector<cv::Rect2f> boxes;
    std::vector<float> scores;
    std::vector<int> columns;

    for (int i = 0; i < N; ++i) {
        float score = get_at(4, i);
        if (score < min_detection_confidence_) {
            continue;
        }

        float cx = get_at(0, i);
        float cy = get_at(1, i);
        float w = get_at(2, i);
        float h = get_at(3, i);

        float x1 = std::clamp((cx - w * 0.5f - prep.pad_x) / prep.scale, 0.f, img_w - 1);
        float y1 = std::clamp((cy - h * 0.5f - prep.pad_y) / prep.scale, 0.f, img_h - 1);
        float x2 = std::clamp((cx + w * 0.5f - prep.pad_x) / prep.scale, 0.f, img_w - 1);
        float y2 = std::clamp((cy + h * 0.5f - prep.pad_y) / prep.scale, 0.f, img_h - 1);
        if (x2 <= x1 || y2 <= y1) {
            continue;
        }

        boxes.emplace_back(x1, y1, x2 - x1, y2 - y1);
        scores.push_back(score);
        columns.push_back(i);
    }

    if (boxes.empty()) {
        return std::nullopt;
    }

    std::vector<int> keep = NMS(boxes, scores, spec_.iou_threshold);
    if (keep.empty()) {
        return std::nullopt;
    }

    // NMS returns the highest score first: that person is the user.
    const int best = keep.front();
    const int column = columns[best];

    PoseEstimate estimate;
    estimate.score = scores[best];
    estimate.box = boxes[best];
    estimate.landmarks.reserve(static_cast<std::size_t>(K));
    for (int k = 0; k < K; ++k) {
        const int base = 5 + k * dims;
        float kx = (get_at(base, column) - prep.pad_x) / prep.scale;
        float ky = (get_at(base + 1, column) - prep.pad_y) / prep.scale;
        float kv = dims == 3 ? get_at(base + 2, column) : 1.0f;

        Landmark lm;
        lm.x = kx / img_w;
        lm.y = ky / img_h;
        lm.z = 0.0f;
        lm.visibility = kv;
        lm.presence = kv;
        estimate.landmarks.push_back(lm);
    }
    return estimate;
}

}  // namespace posture
