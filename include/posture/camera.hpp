#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

#include "posture/config.hpp"
#include "posture/diagnostics.hpp"

namespace posture {

// Device I/O fault raised by the capture backend. Distinct from an ordinary
// "no frame" read failure, which is reported through read()'s return value.
class CameraHardwareError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct OpenResult {
    bool success = false;
    std::optional<CaptureDiagnostic> diagnostic;
};

class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual OpenResult open() = 0;
    // false on an ordinary failure; throws CameraHardwareError on device I/O
    // faults.
    virtual bool read(cv::Mat& frame) = 0;
    // Idempotent.
    virtual void release() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string describe() const = 0;
};

// V4L2 camera through cv::VideoCapture.
class CameraCapture : public FrameSource {
public:
    explicit CameraCapture(CameraConfig config, CaptureDiagnostics diagnostics = CaptureDiagnostics());
    ~CameraCapture() override;

    OpenResult open() override;
    bool read(cv::Mat& frame) override;
    void release() override;
    bool isOpen() const override;
    std::string describe() const override;

private:
    struct Impl;

    CameraConfig config_;
    CaptureDiagnostics diagnostics_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace posture
