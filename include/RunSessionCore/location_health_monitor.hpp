#ifndef LOCATION_HEALTH_MONITOR_HPP_
#define LOCATION_HEALTH_MONITOR_HPP_

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include "RunSessionCore/types.hpp"
#include "RunSessionCore/capabilities.hpp"
#include "RunSessionCore/scheduler.hpp"

/**
 * Observer callbacks for the location stream. All optional.
 */
struct LocationMonitorCallbacks
{
    std::function<void()> on_recovery_started;
    std::function<void()> on_recovery_success;
    std::function<void()> on_recovery_failed;
    std::function<void()> on_gps_lost;
    std::function<void(const PositionSample&)> on_location_update;
    std::function<void(const PositionSample&)> on_spike_filtered;
};

enum class HealthStatus { HEALTHY, STALE, RECOVERING, LOST };

/**
 * Supervises the position subscription.
 * Filters physically implausible fixes, smooths the recent window and
 * restarts the subscription when the stream goes stale. Recovery is a
 * bounded automaton: Idle -> Recovering -> {Idle, Lost}, with at most one
 * attempt in flight. Lost is terminal until stop()/start().
 */
class LocationHealthMonitor
{
public:
    /**
     * Monitor thresholds and timings.
     */
    struct MonitorParams
    {
        int64_t health_check_interval_ms;   // Period of the staleness check
        int64_t staleness_threshold_ms;     // Age after which the stream is stale
        int max_recovery_attempts;          // Attempts before declaring GPS lost
        double max_speed_mps;               // Implied speed above this is a spike
        double max_accuracy_m;              // Coarser fixes are rejected
        size_t window_size;                 // Samples averaged for the smoothed location
        int64_t settle_delay_ms;            // Pause between closing and reopening the stream
        int64_t fetch_timeout_ms;           // Recovery fetch is abandoned after this
        PositionSubscriptionOptions subscription;

        MonitorParams()
            : health_check_interval_ms(10000),
              staleness_threshold_ms(15000),
              max_recovery_attempts(5),
              max_speed_mps(12.5),
              max_accuracy_m(50.0),
              window_size(5),
              settle_delay_ms(1000),
              fetch_timeout_ms(15000)
        {}
    };

    /**
     * @param positions Positioning capability; the monitor is its only subscriber
     * @param lifecycle Application lifecycle signal (may be null)
     * @param scheduler Timer source for health checks and recovery delays
     */
    LocationHealthMonitor(PositionSource& positions,
                          LifecycleSource* lifecycle,
                          Scheduler& scheduler,
                          const MonitorParams& params = MonitorParams());
    ~LocationHealthMonitor();

    LocationHealthMonitor(const LocationHealthMonitor&) = delete;
    LocationHealthMonitor& operator=(const LocationHealthMonitor&) = delete;

    /**
     * Request permission, open the subscription and start health checks.
     *
     * @return false if the capability is absent, permission is denied or the
     *         subscription cannot be opened
     */
    bool start(const LocationMonitorCallbacks& callbacks);

    /**
     * Tear down everything: subscription, timers, in-flight recovery, buffers.
     * Idempotent.
     */
    void stop();

    // Average of the recent accepted window, stamped with the newest sample
    std::optional<PositionSample> smoothed_location() const;
    std::optional<PositionSample> last_location() const;

    bool is_healthy() const;
    bool is_running() const { return enabled_; }
    int recovery_attempts() const { return recovery_attempts_; }
    HealthStatus health_status() const;

    // Feed an application lifecycle transition (also wired from LifecycleSource)
    void handle_app_state_change(AppState next_state);

private:
    bool open_subscription();
    void close_subscription();

    void handle_sample(const PositionSample& sample);
    bool is_valid_sample(const PositionSample& sample) const;
    void add_to_window(const PositionSample& sample);

    void check_health();
    void attempt_recovery();
    void resume_after_settle(uint64_t attempt_id);
    void complete_recovery(uint64_t attempt_id, const std::optional<PositionSample>& fix);
    void report_exhausted();

    PositionSource& positions_;
    LifecycleSource* lifecycle_;
    Scheduler& scheduler_;
    MonitorParams params_;
    LocationMonitorCallbacks callbacks_;

    SubscriptionHandle position_subscription_;
    SubscriptionHandle lifecycle_subscription_;
    TaskHandle health_task_;
    TaskHandle settle_task_;
    TaskHandle fetch_timeout_task_;

    std::optional<PositionSample> last_location_;
    std::deque<PositionSample> recent_points_;

    bool enabled_;
    bool recovering_;
    bool lost_;
    int recovery_attempts_;
    uint64_t recovery_generation_;   // Identifies the attempt late results belong to
    AppState app_state_;
};

#endif // LOCATION_HEALTH_MONITOR_HPP_
