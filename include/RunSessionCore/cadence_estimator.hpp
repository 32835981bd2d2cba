#ifndef CADENCE_ESTIMATOR_HPP_
#define CADENCE_ESTIMATOR_HPP_

#include <cstdint>
#include <deque>
#include <functional>
#include "RunSessionCore/capabilities.hpp"
#include "RunSessionCore/scheduler.hpp"
#include "geometry_msgs/msg/vector3.hpp"

/**
 * Accepted step, kept only inside the rolling window.
 */
struct StepEvent
{
    int64_t timestamp_ms;
    double magnitude;     // Peak acceleration magnitude (g)
};

/**
 * Peak-based step detector over acceleration magnitude.
 * A rising-to-falling transition is a candidate peak; it counts as a step
 * when the peak magnitude and the interval since the previous step are both
 * plausible for running.
 */
class StepDetector
{
public:
    struct DetectorParams
    {
        double min_peak_magnitude;      // g
        double max_peak_magnitude;      // g
        int64_t min_step_interval_ms;
        int64_t max_step_interval_ms;
        int64_t window_ms;              // Rolling window for cadence
        int64_t min_span_ms;            // Shorter windows report 0
        int max_spm;

        DetectorParams()
            : min_peak_magnitude(0.8),
              max_peak_magnitude(3.5),
              min_step_interval_ms(200),
              max_step_interval_ms(1000),
              window_ms(15000),
              min_span_ms(1000),
              max_spm(220)
        {}
    };

    explicit StepDetector(const DetectorParams& params = DetectorParams());

    /**
     * Feed one magnitude sample.
     *
     * @param magnitude Acceleration magnitude (g)
     * @param timestamp_ms Sample time, non-decreasing
     * @return true if the previous sample was accepted as a step
     */
    bool update(double magnitude, int64_t timestamp_ms);

    /**
     * Steps per minute over the window ending at now_ms.
     *
     * @return 0 with fewer than 2 steps or a span under min_span_ms,
     *         otherwise the rounded rate clamped to [0, max_spm]
     */
    int cadence_spm(int64_t now_ms) const;

    size_t step_count() const { return steps_.size(); }
    void reset();

private:
    void prune(int64_t now_ms);

    DetectorParams params_;
    std::deque<StepEvent> steps_;
    int64_t last_step_ms_;
    double last_magnitude_;
    bool rising_;
};

/**
 * Cadence from the motion sensor.
 * Owns the motion subscription and reports the current estimate
 * periodically while active.
 */
class CadenceEstimator
{
public:
    struct CadenceParams
    {
        StepDetector::DetectorParams detector;
        int64_t sample_interval_ms;     // Requested motion sample period
        int64_t report_interval_ms;     // Period of on_update

        CadenceParams()
            : sample_interval_ms(50),
              report_interval_ms(2000)
        {}
    };

    using CadenceCallback = std::function<void(int spm)>;

    CadenceEstimator(MotionSource& motion, Scheduler& scheduler,
                     const CadenceParams& params = CadenceParams());
    ~CadenceEstimator();

    CadenceEstimator(const CadenceEstimator&) = delete;
    CadenceEstimator& operator=(const CadenceEstimator&) = delete;

    /**
     * Subscribe to motion samples and start periodic reports.
     *
     * @return false if the motion sensor is unavailable or cannot be subscribed
     */
    bool start(CadenceCallback on_update);

    // Release the subscription and discard all steps
    void stop();

    int current_spm() const;
    bool is_active() const { return active_; }

private:
    void handle_sample(const geometry_msgs::msg::Vector3& acceleration);

    MotionSource& motion_;
    Scheduler& scheduler_;
    CadenceParams params_;
    StepDetector detector_;
    CadenceCallback on_update_;

    SubscriptionHandle motion_subscription_;
    TaskHandle report_task_;
    bool active_;
};

#endif // CADENCE_ESTIMATOR_HPP_
