#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "posture/alert_tracker.hpp"
#include "test_helpers.hpp"

namespace posture {
namespace {

class AlertTrackerTest : public ::testing::Test {
protected:
    testing::FakeClock clock;
    AlertTracker tracker{600, 300, clock.fn()};

    AlertOutcome observeAt(double t, Posture posture, bool present = true) {
        clock.now = t;
        return tracker.update(posture, present);
    }
};

TEST_F(AlertTrackerTest, ThresholdCooldownAndCorrectionScenario) {
    AlertOutcome out = observeAt(0, Posture::Bad);
    EXPECT_FALSE(out.should_alert);
    EXPECT_EQ(out.duration, 0);
    EXPECT_FALSE(out.threshold_reached);

    out = observeAt(600, Posture::Bad);
    EXPECT_TRUE(out.should_alert);
    EXPECT_TRUE(out.threshold_reached);
    EXPECT_EQ(out.duration, 600);

    out = observeAt(720, Posture::Bad);
    EXPECT_FALSE(out.should_alert);
    EXPECT_TRUE(out.threshold_reached);
    EXPECT_EQ(out.duration, 720);

    out = observeAt(900, Posture::Bad);
    EXPECT_TRUE(out.should_alert);
    EXPECT_EQ(out.duration, 900);

    out = observeAt(930, Posture::Good);
    EXPECT_FALSE(out.should_alert);
    EXPECT_TRUE(out.posture_corrected);
    EXPECT_EQ(out.previous_duration, 930);
    EXPECT_FALSE(tracker.isTracking());
}

TEST_F(AlertTrackerTest, BelowThresholdNeverAlerts) {
    for (int t = 0; t < 600; t += 50) {
        AlertOutcome out = observeAt(t, Posture::Bad);
        EXPECT_FALSE(out.should_alert);
        EXPECT_FALSE(out.threshold_reached);
        EXPECT_EQ(out.duration, t);
    }
}

TEST_F(AlertTrackerTest, GoodWithoutPriorAlertReportsNoCorrection) {
    observeAt(0, Posture::Bad);
    observeAt(300, Posture::Bad);
    AlertOutcome out = observeAt(310, Posture::Good);
    EXPECT_FALSE(out.posture_corrected);
    EXPECT_EQ(out.previous_duration, 0);
    EXPECT_FALSE(tracker.isTracking());
}

TEST_F(AlertTrackerTest, AbsenceResetsTracking) {
    observeAt(0, Posture::Bad);
    observeAt(500, Posture::Bad);
    AlertOutcome out = observeAt(550, Posture::Bad, false);
    EXPECT_EQ(out.duration, 0);
    EXPECT_FALSE(tracker.isTracking());

    out = observeAt(600, Posture::Bad);
    EXPECT_EQ(out.duration, 0);
    EXPECT_FALSE(out.should_alert);
}

TEST_F(AlertTrackerTest, UnknownResetsTrackingAndAlertHistory) {
    observeAt(0, Posture::Bad);
    EXPECT_TRUE(observeAt(600, Posture::Bad).should_alert);
    observeAt(610, Posture::Unknown);

    // A fresh period alerts again at its own threshold without cooldown carry-over.
    observeAt(620, Posture::Bad);
    AlertOutcome out = observeAt(1220, Posture::Bad);
    EXPECT_TRUE(out.should_alert);
    EXPECT_EQ(out.duration, 600);
}

TEST_F(AlertTrackerTest, PauseZeroesAndResumeStartsFresh) {
    observeAt(0, Posture::Bad);
    observeAt(400, Posture::Bad);

    clock.now = 450;
    tracker.pause();
    EXPECT_TRUE(tracker.isPaused());
    EXPECT_FALSE(tracker.isTracking());
    EXPECT_FALSE(tracker.status().monitoring_active);

    AlertOutcome paused = observeAt(2000, Posture::Bad);
    EXPECT_FALSE(paused.should_alert);
    EXPECT_EQ(paused.duration, 0);

    tracker.resume();
    EXPECT_FALSE(tracker.isPaused());
    EXPECT_TRUE(tracker.status().monitoring_active);

    AlertOutcome out = observeAt(2100, Posture::Bad);
    EXPECT_EQ(out.duration, 0);
    out = observeAt(2200, Posture::Bad);
    EXPECT_EQ(out.duration, 100);
}

TEST_F(AlertTrackerTest, PauseIsIdempotent) {
    tracker.pause();
    tracker.pause();
    EXPECT_TRUE(tracker.isPaused());
    tracker.resume();
    tracker.resume();
    EXPECT_FALSE(tracker.isPaused());
}

TEST_F(AlertTrackerTest, StatusReportsConfiguration) {
    MonitoringStatus status = tracker.status();
    EXPECT_TRUE(status.monitoring_active);
    EXPECT_EQ(status.threshold_seconds, 600);
    EXPECT_EQ(status.cooldown_seconds, 300);
}

TEST(AlertTrackerConcurrencyTest, PauseResumeRacingUpdatesLeavesConsistentState) {
    const auto origin = std::chrono::steady_clock::now();
    AlertTracker tracker(600, 300, [origin]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - origin).count();
    });

    std::atomic<bool> done{false};
    std::atomic<int> updates{0};
    std::thread worker([&]() {
        while (!done.load()) {
            AlertOutcome out = tracker.update(Posture::Bad, true);
            EXPECT_GE(out.duration, 0);
            EXPECT_FALSE(out.should_alert);
            ++updates;
        }
    });

    std::thread controller([&]() {
        for (int i = 0; i < 500; ++i) {
            if (i % 2 == 0) {
                tracker.pause();
            } else {
                tracker.resume();
            }
            tracker.status();
            tracker.isTracking();
        }
    });
    controller.join();
    tracker.pause();

    // Let the worker observe the final pause a few times.
    const int seen = updates.load();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (updates.load() < seen + 20 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    done.store(true);
    worker.join();

    EXPECT_TRUE(tracker.isPaused());
    EXPECT_FALSE(tracker.isTracking());

    tracker.resume();
    EXPECT_EQ(tracker.update(Posture::Bad, true).duration, 0);
    EXPECT_TRUE(tracker.isTracking());
}

}  // namespace
}  // namespace posture
