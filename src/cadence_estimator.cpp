#include "RunSessionCore/cadence_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <utility>
#include "rclcpp/rclcpp.hpp"

namespace
{
const rclcpp::Logger LOGGER = rclcpp::get_logger("cadence");
}  // namespace

StepDetector::StepDetector(const DetectorParams& params)
    : params_(params),
      last_step_ms_(0),
      last_magnitude_(0.0),
      rising_(false)
{
}

bool StepDetector::update(double magnitude, int64_t timestamp_ms)
{
    prune(timestamp_ms);

    bool accepted = false;
    if (magnitude > last_magnitude_) {
        rising_ = true;
    } else if (rising_ && magnitude < last_magnitude_) {
        rising_ = false;
        double peak = last_magnitude_;

        if (peak >= params_.min_peak_magnitude && peak <= params_.max_peak_magnitude) {
            int64_t interval = timestamp_ms - last_step_ms_;
            // An empty window restarts the chain, otherwise a pause longer
            // than the max interval would block detection for good
            bool first_step = steps_.empty();

            if (first_step ||
                (interval >= params_.min_step_interval_ms &&
                 interval <= params_.max_step_interval_ms)) {
                steps_.push_back(StepEvent{timestamp_ms, peak});
                last_step_ms_ = timestamp_ms;
                accepted = true;
            }
        }
    }

    last_magnitude_ = magnitude;
    return accepted;
}

int StepDetector::cadence_spm(int64_t now_ms) const
{
    auto first = std::find_if(steps_.begin(), steps_.end(),
        [this, now_ms](const StepEvent& step) { return now_ms - step.timestamp_ms < params_.window_ms; });

    long count = std::distance(first, steps_.end());
    if (count < 2) return 0;

    int64_t span_ms = steps_.back().timestamp_ms - first->timestamp_ms;
    if (span_ms < params_.min_span_ms) return 0;

    double steps_per_minute = static_cast<double>(count - 1) / span_ms * 60000.0;
    long rounded = std::lround(steps_per_minute);
    return static_cast<int>(std::clamp(rounded, 0L, static_cast<long>(params_.max_spm)));
}

void StepDetector::reset()
{
    steps_.clear();
    last_step_ms_ = 0;
    last_magnitude_ = 0.0;
    rising_ = false;
}

void StepDetector::prune(int64_t now_ms)
{
    while (!steps_.empty() && now_ms - steps_.front().timestamp_ms >= params_.window_ms) {
        steps_.pop_front();
    }
}

CadenceEstimator::CadenceEstimator(MotionSource& motion, Scheduler& scheduler,
                                   const CadenceParams& params)
    : motion_(motion),
      scheduler_(scheduler),
      params_(params),
      detector_(params.detector),
      active_(false)
{
}

CadenceEstimator::~CadenceEstimator()
{
    stop();
}

bool CadenceEstimator::start(CadenceCallback on_update)
{
    if (active_) {
        stop();
    }

    detector_.reset();
    on_update_ = std::move(on_update);

    try {
        if (!motion_.is_available()) {
            RCLCPP_WARN(LOGGER, "Motion sensor not available");
            return false;
        }

        motion_subscription_ = motion_.subscribe(params_.sample_interval_ms,
            [this](const geometry_msgs::msg::Vector3& acceleration) {
                this->handle_sample(acceleration);
            });
    } catch (const std::exception& e) {
        RCLCPP_ERROR(LOGGER, "Failed to start cadence detection: %s", e.what());
        return false;
    }

    active_ = true;
    report_task_ = scheduler_.schedule_periodic(
        std::chrono::milliseconds(params_.report_interval_ms),
        [this]() {
            if (on_update_) on_update_(this->current_spm());
        });

    RCLCPP_INFO(LOGGER, "Cadence detection started: sample=%lldms, report=%lldms",
        static_cast<long long>(params_.sample_interval_ms),
        static_cast<long long>(params_.report_interval_ms));
    return true;
}

void CadenceEstimator::stop()
{
    motion_subscription_.unsubscribe();
    report_task_.cancel();
    detector_.reset();
    on_update_ = nullptr;

    if (active_) {
        active_ = false;
        RCLCPP_INFO(LOGGER, "Cadence detection stopped");
    }
}

int CadenceEstimator::current_spm() const
{
    return detector_.cadence_spm(scheduler_.now_ms());
}

void CadenceEstimator::handle_sample(const geometry_msgs::msg::Vector3& acceleration)
{
    if (!active_) return;

    double magnitude = std::sqrt(acceleration.x * acceleration.x +
                                 acceleration.y * acceleration.y +
                                 acceleration.z * acceleration.z);
    if (detector_.update(magnitude, scheduler_.now_ms())) {
        RCLCPP_DEBUG(LOGGER, "Step detected, %zu in window", detector_.step_count());
    }
}
