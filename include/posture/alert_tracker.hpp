#pragma once

#include <functional>
#include <mutex>
#include <optional>

#include "posture/landmarks.hpp"

namespace posture {

// Seconds on a monotonic time base.
using SecondsClock = std::function<double()>;

SecondsClock steadySecondsClock();

struct AlertOutcome {
    bool should_alert = false;
    int duration = 0;
    bool threshold_reached = false;
    bool posture_corrected = false;
    int previous_duration = 0;
};

struct MonitoringStatus {
    bool monitoring_active = true;
    int threshold_seconds = 0;
    int cooldown_seconds = 0;
};

// Duration / threshold / cooldown state machine over per-cycle posture.
// update() runs on the worker; pause(), resume() and status() may be called
// from any thread. A single mutex covers the whole field group.
class AlertTracker {
public:
    AlertTracker(int threshold_seconds, int cooldown_seconds, SecondsClock clock = {});

    AlertOutcome update(Posture posture, bool user_present);

    void pause();
    void resume();

    bool isPaused() const;
    bool isTracking() const;
    MonitoringStatus status() const;

private:
    void resetLocked();

    const int threshold_seconds_;
    const int cooldown_seconds_;
    SecondsClock clock_;

    mutable std::mutex mutex_;
    std::optional<double> tracking_start_;
    std::optional<double> last_alert_;
    bool paused_ = false;
    std::optional<double> pause_started_;
};

}  // namespace posture
