#include "posture/camera.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <utility>

#include <opencv2/videoio.hpp>

namespace posture {
namespace {

constexpr std::chrono::milliseconds kReleaseLockWait{500};

}  // namespace

struct CameraCapture::Impl {
    mutable std::timed_mutex mutex;
    cv::VideoCapture capture;
};

CameraCapture::CameraCapture(CameraConfig config, CaptureDiagnostics diagnostics)
    : config_(std::move(config)), diagnostics_(std::move(diagnostics)), impl_(std::make_unique<Impl>()) {}

CameraCapture::~CameraCapture() {
    release();
}

std::string CameraCapture::describe() const {
    return diagnostics_.devicePath(config_.device);
}

OpenResult CameraCapture::open() {
    OpenResult result;

    if (auto problem = diagnostics_.preflight(config_.device)) {
        std::cerr << "[Camera] Pre-flight check failed: " << problem->message << std::endl;
        result.diagnostic = std::move(problem);
        return result;
    }

    Resolution resolution = resolutionDimensions(config_.resolution);

    std::string failure;
    {
        std::lock_guard<std::timed_mutex> lock(impl_->mutex);
        try {
            if (impl_->capture.isOpened()) {
                impl_->capture.release();
            }
            if (impl_->capture.open(config_.device, cv::CAP_V4L2)) {
                impl_->capture.set(cv::CAP_PROP_FRAME_WIDTH, resolution.width);
                impl_->capture.set(cv::CAP_PROP_FRAME_HEIGHT, resolution.height);
                impl_->capture.set(cv::CAP_PROP_FPS, config_.fps_target);

                // First frames after opening are frequently corrupt.
                cv::Mat discard;
                for (int i = 0; i < config_.warmup_frames; ++i) {
                    impl_->capture.read(discard);
                }
                result.success = true;
            } else {
                failure = "VideoCapture failed to open " + describe();
            }
        } catch (const cv::Exception& ex) {
            impl_->capture.release();
            failure = ex.what();
        }
    }

    if (result.success) {
        std::cout << "[Camera] Opened " << describe() << " at " << resolution.width << "x" << resolution.height
                  << " (" << config_.fps_target << " fps target)" << std::endl;
        return result;
    }

    std::cerr << "[Camera] " << failure << std::endl;
    result.diagnostic = diagnostics_.diagnose(config_.device, failure);
    return result;
}

bool CameraCapture::read(cv::Mat& frame) {
    std::lock_guard<std::timed_mutex> lock(impl_->mutex);
    if (!impl_->capture.isOpened()) {
        return false;
    }
    try {
        if (!impl_->capture.read(frame)) {
            return false;
        }
    } catch (const cv::Exception& ex) {
        throw CameraHardwareError(std::string("Camera I/O fault: ") + ex.what());
    }
    return !frame.empty();
}

void CameraCapture::release() {
    if (!impl_) {
        return;
    }
    // read() holds the lock for the whole driver call. When a read is stuck
    // there, closing the device is the only way to get it back.
    std::unique_lock<std::timed_mutex> lock(impl_->mutex, std::defer_lock);
    if (!lock.try_lock_for(kReleaseLockWait)) {
        std::cerr << "[Camera] Read still blocked, forcing release of " << describe() << std::endl;
    }
    if (impl_->capture.isOpened()) {
        impl_->capture.release();
        std::cout << "[Camera] Released " << describe() << std::endl;
    }
}

bool CameraCapture::isOpen() const {
    std::lock_guard<std::timed_mutex> lock(impl_->mutex);
    return impl_->capture.isOpened();
}

}  // namespace posture
