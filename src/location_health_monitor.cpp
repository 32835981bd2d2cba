#include "RunSessionCore/location_health_monitor.hpp"
#include <exception>
#include "RunSessionCore/geo.hpp"
#include "rclcpp/rclcpp.hpp"

namespace
{
const rclcpp::Logger LOGGER = rclcpp::get_logger("location_monitor");

void notify(const std::function<void()>& callback)
{
    if (callback) callback();
}
}  // namespace

LocationHealthMonitor::LocationHealthMonitor(PositionSource& positions,
                                             LifecycleSource* lifecycle,
                                             Scheduler& scheduler,
                                             const MonitorParams& params)
    : positions_(positions),
      lifecycle_(lifecycle),
      scheduler_(scheduler),
      params_(params),
      enabled_(false),
      recovering_(false),
      lost_(false),
      recovery_attempts_(0),
      recovery_generation_(0),
      app_state_(AppState::ACTIVE)
{
}

LocationHealthMonitor::~LocationHealthMonitor()
{
    stop();
}

bool LocationHealthMonitor::start(const LocationMonitorCallbacks& callbacks)
{
    if (enabled_) {
        stop();
    }

    callbacks_ = callbacks;
    recovery_attempts_ = 0;
    recovering_ = false;
    lost_ = false;
    recent_points_.clear();
    last_location_.reset();
    app_state_ = AppState::ACTIVE;

    PermissionStatus permission = PermissionStatus::UNAVAILABLE;
    try {
        permission = positions_.request_permission();
    } catch (const std::exception& e) {
        RCLCPP_ERROR(LOGGER, "Permission request failed: %s", e.what());
        return false;
    }

    if (permission == PermissionStatus::UNAVAILABLE) {
        RCLCPP_WARN(LOGGER, "Positioning capability not available");
        return false;
    }
    if (permission == PermissionStatus::DENIED) {
        RCLCPP_WARN(LOGGER, "Location permission denied");
        return false;
    }

    enabled_ = true;
    if (!open_subscription()) {
        enabled_ = false;
        return false;
    }

    if (lifecycle_) {
        lifecycle_subscription_ = lifecycle_->subscribe(
            [this](AppState state) { this->handle_app_state_change(state); });
    }

    health_task_ = scheduler_.schedule_periodic(
        std::chrono::milliseconds(params_.health_check_interval_ms),
        [this]() { this->check_health(); });

    RCLCPP_INFO(LOGGER, "Location monitor started: check=%lldms, stale=%lldms, max_attempts=%d",
        static_cast<long long>(params_.health_check_interval_ms),
        static_cast<long long>(params_.staleness_threshold_ms),
        params_.max_recovery_attempts);
    return true;
}

void LocationHealthMonitor::stop()
{
    bool was_enabled = enabled_;

    enabled_ = false;
    recovering_ = false;
    ++recovery_generation_;  // Orphan any in-flight fetch result

    health_task_.cancel();
    settle_task_.cancel();
    fetch_timeout_task_.cancel();
    close_subscription();
    lifecycle_subscription_.unsubscribe();

    recent_points_.clear();
    last_location_.reset();

    if (was_enabled) {
        RCLCPP_INFO(LOGGER, "Location monitor stopped");
    }
}

bool LocationHealthMonitor::open_subscription()
{
    close_subscription();

    try {
        position_subscription_ = positions_.subscribe(
            params_.subscription,
            [this](const PositionSample& sample) { this->handle_sample(sample); });
    } catch (const std::exception& e) {
        RCLCPP_ERROR(LOGGER, "Failed to start location tracking: %s", e.what());
        return false;
    }

    return position_subscription_.is_active();
}

void LocationHealthMonitor::close_subscription()
{
    position_subscription_.unsubscribe();
}

void LocationHealthMonitor::handle_sample(const PositionSample& sample)
{
    if (!enabled_) return;

    // The fix that answered a recovery fetch may arrive again on the stream
    if (last_location_ && sample.timestamp_ms == last_location_->timestamp_ms &&
        sample.latitude == last_location_->latitude &&
        sample.longitude == last_location_->longitude) {
        return;
    }

    if (!is_valid_sample(sample)) {
        RCLCPP_DEBUG(LOGGER, "Filtered implausible fix at t=%lld",
            static_cast<long long>(sample.timestamp_ms));
        if (callbacks_.on_spike_filtered) callbacks_.on_spike_filtered(sample);
        return;
    }

    last_location_ = sample;
    add_to_window(sample);
    if (callbacks_.on_location_update) callbacks_.on_location_update(sample);
}

// Reject out-of-order, too-fast or too-coarse fixes
bool LocationHealthMonitor::is_valid_sample(const PositionSample& sample) const
{
    if (sample.accuracy_m && *sample.accuracy_m > params_.max_accuracy_m) {
        return false;
    }

    if (!last_location_) return true;

    double elapsed_s = (sample.timestamp_ms - last_location_->timestamp_ms) / 1000.0;
    if (elapsed_s <= 0.0) return false;

    double distance = haversine_distance(
        last_location_->latitude, last_location_->longitude,
        sample.latitude, sample.longitude);

    return distance / elapsed_s <= params_.max_speed_mps;
}

void LocationHealthMonitor::add_to_window(const PositionSample& sample)
{
    recent_points_.push_back(sample);
    while (recent_points_.size() > params_.window_size) {
        recent_points_.pop_front();
    }
}

std::optional<PositionSample> LocationHealthMonitor::smoothed_location() const
{
    if (recent_points_.empty()) return std::nullopt;
    if (recent_points_.size() == 1) return recent_points_.front();

    double lat_sum = 0.0;
    double lng_sum = 0.0;
    for (const auto& point : recent_points_) {
        lat_sum += point.latitude;
        lng_sum += point.longitude;
    }

    PositionSample smoothed;
    smoothed.latitude = lat_sum / recent_points_.size();
    smoothed.longitude = lng_sum / recent_points_.size();
    smoothed.timestamp_ms = recent_points_.back().timestamp_ms;
    return smoothed;
}

std::optional<PositionSample> LocationHealthMonitor::last_location() const
{
    return last_location_;
}

bool LocationHealthMonitor::is_healthy() const
{
    if (!last_location_) return false;
    return (scheduler_.now_ms() - last_location_->timestamp_ms) < params_.staleness_threshold_ms;
}

HealthStatus LocationHealthMonitor::health_status() const
{
    if (lost_) return HealthStatus::LOST;
    if (recovering_) return HealthStatus::RECOVERING;
    return is_healthy() ? HealthStatus::HEALTHY : HealthStatus::STALE;
}

void LocationHealthMonitor::handle_app_state_change(AppState next_state)
{
    // The OS may suspend the stream while backgrounded; restart it on return
    if (app_state_ == AppState::BACKGROUND && next_state == AppState::ACTIVE) {
        if (enabled_ && !recovering_) {
            RCLCPP_INFO(LOGGER, "Returned to foreground, restarting location stream");
            attempt_recovery();
        }
    }
    app_state_ = next_state;
}

void LocationHealthMonitor::check_health()
{
    if (!enabled_ || recovering_ || lost_) return;

    bool is_stale = !last_location_ ||
        (scheduler_.now_ms() - last_location_->timestamp_ms) > params_.staleness_threshold_ms;

    if (is_stale) {
        RCLCPP_WARN(LOGGER, "Location stream stale, attempting recovery");
        attempt_recovery();
    }
}

void LocationHealthMonitor::attempt_recovery()
{
    if (!enabled_ || recovering_ || lost_) return;

    if (recovery_attempts_ >= params_.max_recovery_attempts) {
        report_exhausted();
        return;
    }

    recovering_ = true;
    ++recovery_attempts_;
    uint64_t attempt_id = ++recovery_generation_;

    RCLCPP_INFO(LOGGER, "Recovery attempt %d/%d",
        recovery_attempts_, params_.max_recovery_attempts);
    notify(callbacks_.on_recovery_started);

    close_subscription();
    settle_task_ = scheduler_.schedule_once(
        std::chrono::milliseconds(params_.settle_delay_ms),
        [this, attempt_id]() { this->resume_after_settle(attempt_id); });
}

void LocationHealthMonitor::resume_after_settle(uint64_t attempt_id)
{
    if (attempt_id != recovery_generation_ || !recovering_) return;

    if (!open_subscription()) {
        complete_recovery(attempt_id, std::nullopt);
        return;
    }

    fetch_timeout_task_ = scheduler_.schedule_once(
        std::chrono::milliseconds(params_.fetch_timeout_ms),
        [this, attempt_id]() {
            RCLCPP_WARN(LOGGER, "Recovery fix timed out");
            this->complete_recovery(attempt_id, std::nullopt);
        });

    try {
        positions_.fetch_once(LocationAccuracy::HIGH,
            [this, attempt_id](std::optional<PositionSample> fix) {
                this->complete_recovery(attempt_id, fix);
            });
    } catch (const std::exception& e) {
        RCLCPP_ERROR(LOGGER, "Recovery fix request failed: %s", e.what());
        complete_recovery(attempt_id, std::nullopt);
    }
}

void LocationHealthMonitor::complete_recovery(uint64_t attempt_id,
                                              const std::optional<PositionSample>& fix)
{
    if (attempt_id != recovery_generation_ || !recovering_) return;

    fetch_timeout_task_.cancel();
    recovering_ = false;

    if (fix) {
        last_location_ = *fix;
        recovery_attempts_ = 0;
        RCLCPP_INFO(LOGGER, "Location stream recovered");
        notify(callbacks_.on_recovery_success);
        return;
    }

    RCLCPP_WARN(LOGGER, "Recovery attempt %d failed", recovery_attempts_);
    if (recovery_attempts_ >= params_.max_recovery_attempts) {
        report_exhausted();
    }
}

void LocationHealthMonitor::report_exhausted()
{
    if (lost_) return;

    lost_ = true;
    health_task_.cancel();
    RCLCPP_ERROR(LOGGER, "GPS lost after %d recovery attempts", recovery_attempts_);
    notify(callbacks_.on_recovery_failed);
    notify(callbacks_.on_gps_lost);
}
