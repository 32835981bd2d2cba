/*
 * Unit tests for step detection and cadence reporting
 * Tests: Detector, Window, Estimator
 */

#include <gtest/gtest.h>
#include <vector>
#include "RunSessionCore/cadence_estimator.hpp"
#include "fake_capabilities.hpp"
#include "manual_scheduler.hpp"

// ============================================================================
// Test Helpers
// ============================================================================

static constexpr double BASELINE_G = 0.1;
static constexpr double PEAK_G = 1.6;
static constexpr int64_t SAMPLE_MS = 50;

// One stride: baseline, peak, baseline. The step is stamped at the falling sample.
static int64_t feed_step(StepDetector& detector, int64_t start_ms, double peak = PEAK_G) {
    detector.update(BASELINE_G, start_ms);
    detector.update(peak, start_ms + SAMPLE_MS);
    detector.update(BASELINE_G, start_ms + 2 * SAMPLE_MS);
    return start_ms + 2 * SAMPLE_MS;
}

// Steps at a fixed period; returns the timestamp of the last step
static int64_t feed_steps(StepDetector& detector, int64_t start_ms, int count, int64_t period_ms) {
    int64_t last = start_ms;
    for (int i = 0; i < count; ++i) {
        last = feed_step(detector, start_ms + i * period_ms);
    }
    return last;
}

// ============================================================================
// Test Suite: Cadence_Detector
// ============================================================================

TEST(Cadence_Detector, SteadyHalfSecondStrideIs120) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 10, 500);

    EXPECT_EQ(detector.step_count(), 10U);
    EXPECT_EQ(detector.cadence_spm(last), 120);
}

TEST(Cadence_Detector, UpdateReportsAcceptedStep) {
    StepDetector detector;

    EXPECT_FALSE(detector.update(BASELINE_G, 1000));
    EXPECT_FALSE(detector.update(PEAK_G, 1050));
    EXPECT_TRUE(detector.update(BASELINE_G, 1100));
    EXPECT_FALSE(detector.update(BASELINE_G, 1150));
}

TEST(Cadence_Detector, FastStrideClampedTo220) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 20, 250);

    EXPECT_EQ(detector.step_count(), 20U);
    EXPECT_EQ(detector.cadence_spm(last), 220);
}

TEST(Cadence_Detector, PeaksOutsideRangeIgnored) {
    StepDetector detector;
    int64_t t = 1000;
    for (int i = 0; i < 5; ++i) {
        feed_step(detector, t, 0.5);
        t += 500;
        feed_step(detector, t, 4.0);
        t += 500;
    }

    EXPECT_EQ(detector.step_count(), 0U);
    EXPECT_EQ(detector.cadence_spm(t), 0);
}

TEST(Cadence_Detector, TooShortIntervalRejected) {
    StepDetector detector;
    feed_step(detector, 1000);
    feed_step(detector, 1150);

    EXPECT_EQ(detector.step_count(), 1U);
}

TEST(Cadence_Detector, TooLongIntervalRejected) {
    StepDetector detector;
    feed_step(detector, 1000);
    feed_step(detector, 2200);

    EXPECT_EQ(detector.step_count(), 1U);
}

TEST(Cadence_Detector, RoundsToNearest) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 21, 700);

    // 20 intervals over 14 s = 85.7 spm
    EXPECT_EQ(detector.cadence_spm(last), 86);
}

TEST(Cadence_Detector, ResetDiscardsSteps) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 6, 500);
    detector.reset();

    EXPECT_EQ(detector.step_count(), 0U);
    EXPECT_EQ(detector.cadence_spm(last), 0);
}

// ============================================================================
// Test Suite: Cadence_Window
// ============================================================================

TEST(Cadence_Window, SingleStepReportsZero) {
    StepDetector detector;
    int64_t last = feed_step(detector, 1000);

    EXPECT_EQ(detector.cadence_spm(last), 0);
}

TEST(Cadence_Window, ShortSpanReportsZero) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 3, 400);

    EXPECT_EQ(detector.step_count(), 3U);
    EXPECT_EQ(detector.cadence_spm(last), 0);
}

TEST(Cadence_Window, OldStepsFallOutOfWindow) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 10, 500);

    EXPECT_EQ(detector.cadence_spm(last + 10000), 120);
    EXPECT_EQ(detector.cadence_spm(last + 15000), 0);
}

TEST(Cadence_Window, ChainRestartsAfterLongPause) {
    StepDetector detector;
    int64_t last = feed_steps(detector, 1000, 5, 500);

    int64_t resume = last + 16000;
    int64_t newest = feed_steps(detector, resume, 5, 500);

    EXPECT_EQ(detector.step_count(), 5U);
    EXPECT_EQ(detector.cadence_spm(newest), 120);
}

// ============================================================================
// Test Suite: Cadence_Estimator
// ============================================================================

class CadenceEstimatorTest : public ::testing::Test {
protected:
    CadenceEstimatorTest() : estimator(motion, scheduler) {}

    // Vertical strides at the given period, driven through the fake sensor
    void run_strides(int count, int64_t period_ms, double peak = PEAK_G) {
        for (int i = 0; i < count; ++i) {
            motion.emit(0.0, 0.0, BASELINE_G);
            scheduler.advance(SAMPLE_MS);
            motion.emit(0.0, 0.0, peak);
            scheduler.advance(SAMPLE_MS);
            motion.emit(0.0, 0.0, BASELINE_G);
            scheduler.advance(period_ms - 2 * SAMPLE_MS);
        }
    }

    ManualScheduler scheduler;
    FakeMotionSource motion;
    CadenceEstimator estimator;
    std::vector<int> reports;
};

TEST_F(CadenceEstimatorTest, UnavailableSensorFailsStart) {
    motion.available = false;

    EXPECT_FALSE(estimator.start([this](int spm) { reports.push_back(spm); }));
    EXPECT_FALSE(estimator.is_active());
    EXPECT_EQ(scheduler.pending_count(), 0U);
}

TEST_F(CadenceEstimatorTest, StartSubscribesAtSampleRate) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));

    EXPECT_TRUE(estimator.is_active());
    EXPECT_TRUE(motion.is_subscribed());
    EXPECT_EQ(motion.last_interval_ms, 50);
}

TEST_F(CadenceEstimatorTest, ReportsEveryTwoSeconds) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));

    run_strides(12, 500);

    ASSERT_EQ(reports.size(), 3U);
    EXPECT_EQ(reports[0], 120);
    EXPECT_EQ(reports[2], 120);
    EXPECT_EQ(estimator.current_spm(), 120);
}

TEST_F(CadenceEstimatorTest, MagnitudeCombinesAxes) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));

    for (int i = 0; i < 10; ++i) {
        motion.emit(0.06, 0.08, 0.0);        // 0.1 g
        scheduler.advance(SAMPLE_MS);
        motion.emit(0.6, 0.8, 0.0);          // 1.0 g
        scheduler.advance(SAMPLE_MS);
        motion.emit(0.06, 0.08, 0.0);
        scheduler.advance(400);
    }

    EXPECT_EQ(estimator.current_spm(), 120);
}

TEST_F(CadenceEstimatorTest, StandingStillReportsZero) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));

    run_strides(8, 500, 0.3);

    ASSERT_EQ(reports.size(), 2U);
    EXPECT_EQ(reports[0], 0);
    EXPECT_EQ(reports[1], 0);
}

TEST_F(CadenceEstimatorTest, StopReleasesEverything) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));
    run_strides(6, 500);

    estimator.stop();

    EXPECT_FALSE(estimator.is_active());
    EXPECT_FALSE(motion.is_subscribed());
    EXPECT_EQ(motion.unsubscribe_count, 1);
    EXPECT_EQ(scheduler.pending_count(), 0U);
    EXPECT_EQ(estimator.current_spm(), 0);

    size_t reported = reports.size();
    scheduler.advance(10000);
    EXPECT_EQ(reports.size(), reported);

    estimator.stop();
    EXPECT_EQ(motion.unsubscribe_count, 1);
}

TEST_F(CadenceEstimatorTest, RestartBeginsFresh) {
    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));
    run_strides(6, 500);

    ASSERT_TRUE(estimator.start([this](int spm) { reports.push_back(spm); }));
    EXPECT_EQ(estimator.current_spm(), 0);
    EXPECT_EQ(motion.unsubscribe_count, 1);
    EXPECT_TRUE(motion.is_subscribed());
}
