#include "posture/alert_tracker.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace posture {

SecondsClock steadySecondsClock() {
    return []() {
        auto now = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    };
}

AlertTracker::AlertTracker(int threshold_seconds, int cooldown_seconds, SecondsClock clock)
    : threshold_seconds_(threshold_seconds),
      cooldown_seconds_(cooldown_seconds),
      clock_(clock ? std::move(clock) : steadySecondsClock()) {}

void AlertTracker::resetLocked() {
    tracking_start_.reset();
    last_alert_.reset();
}

AlertOutcome AlertTracker::update(Posture posture, bool user_present) {
    const double now = clock_();
    AlertOutcome outcome;

    std::lock_guard<std::mutex> lock(mutex_);

    if (paused_ || !user_present || posture == Posture::Unknown) {
        resetLocked();
        return outcome;
    }

    if (posture == Posture::Bad) {
        if (!tracking_start_) {
            tracking_start_ = now;
            std::cout << "[Alert] Bad posture tracking started" << std::endl;
        }

        outcome.duration = static_cast<int>(now - *tracking_start_);
        if (outcome.duration >= threshold_seconds_) {
            outcome.threshold_reached = true;
            if (!last_alert_ || now - *last_alert_ >= cooldown_seconds_) {
                outcome.should_alert = true;
                last_alert_ = now;
                std::cout << "[Alert] Bad posture threshold reached: " << outcome.duration << "s" << std::endl;
            }
        }
        return outcome;
    }

    // Good posture. The correction is only reported for a period that has
    // produced at least one alert.
    if (tracking_start_ && last_alert_) {
        outcome.posture_corrected = true;
        outcome.previous_duration = static_cast<int>(now - *tracking_start_);
        std::cout << "[Alert] Posture corrected after " << outcome.previous_duration << "s" << std::endl;
    }
    resetLocked();
    return outcome;
}

void AlertTracker::pause() {
    const double now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
    paused_ = true;
    pause_started_ = now;
    std::cout << "[Alert] Monitoring paused" << std::endl;
}

void AlertTracker::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_ && pause_started_) {
        std::cout << "[Alert] Monitoring resumed after " << static_cast<int>(clock_() - *pause_started_) << "s"
                  << std::endl;
    }
    paused_ = false;
    pause_started_.reset();
}

bool AlertTracker::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool AlertTracker::isTracking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracking_start_.has_value();
}

MonitoringStatus AlertTracker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MonitoringStatus status;
    status.monitoring_active = !paused_;
    status.threshold_seconds = threshold_seconds_;
    status.cooldown_seconds = cooldown_seconds_;
    return status;
}

}  // namespace posture
