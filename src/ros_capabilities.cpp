#include "RunSessionCore/ros_capabilities.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include "sensor_msgs/msg/nav_sat_status.hpp"

using std::placeholders::_1;

namespace
{
constexpr double STANDARD_GRAVITY = 9.80665;  // m/s^2 per g

int64_t node_now_ms(rclcpp::Node* node)
{
    return node->get_clock()->now().nanoseconds() / 1000000;
}
}  // namespace

// ---------------------------------------------------------------------------
// NavSatFixPositionSource
// ---------------------------------------------------------------------------

NavSatFixPositionSource::NavSatFixPositionSource(rclcpp::Node* node, bool permission_granted)
    : node_(node),
      permission_granted_(permission_granted),
      next_listener_id_(1)
{
    fix_sub_ = node_->create_subscription<sensor_msgs::msg::NavSatFix>(
        "fix", 10, std::bind(&NavSatFixPositionSource::fix_callback, this, _1));
}

PermissionStatus NavSatFixPositionSource::request_permission()
{
    return permission_granted_ ? PermissionStatus::GRANTED : PermissionStatus::DENIED;
}

SubscriptionHandle NavSatFixPositionSource::subscribe(const PositionSubscriptionOptions& options,
                                                      PositionCallback on_sample)
{
    uint64_t id = next_listener_id_++;
    listeners_[id] = Listener{options, std::move(on_sample), std::nullopt};
    return SubscriptionHandle([this, id]() { listeners_.erase(id); });
}

void NavSatFixPositionSource::fetch_once(LocationAccuracy /*accuracy*/,
                                         PositionFetchCallback on_result)
{
    if (!permission_granted_) {
        on_result(std::nullopt);
        return;
    }
    // Answered by the next usable fix
    pending_fetches_.push_back(std::move(on_result));
}

void NavSatFixPositionSource::fix_callback(const sensor_msgs::msg::NavSatFix::SharedPtr msg)
{
    std::optional<PositionSample> sample = to_sample(*msg);
    if (!sample) return;

    std::vector<PositionFetchCallback> fetches;
    fetches.swap(pending_fetches_);
    for (auto& fetch : fetches) {
        fetch(sample);
    }

    // Listeners may unsubscribe from inside their callback
    std::vector<uint64_t> ids;
    for (const auto& entry : listeners_) {
        ids.push_back(entry.first);
    }

    for (uint64_t id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) continue;

        Listener& listener = it->second;
        if (!should_deliver_position(listener.options, listener.last_delivered, *sample)) {
            continue;
        }
        listener.last_delivered = *sample;
        PositionCallback callback = listener.callback;
        callback(*sample);
    }
}

std::optional<PositionSample> NavSatFixPositionSource::to_sample(
    const sensor_msgs::msg::NavSatFix& msg) const
{
    if (msg.status.status == sensor_msgs::msg::NavSatStatus::STATUS_NO_FIX) {
        return std::nullopt;
    }
    if (!std::isfinite(msg.latitude) || !std::isfinite(msg.longitude)) {
        return std::nullopt;
    }

    PositionSample sample;
    sample.latitude = msg.latitude;
    sample.longitude = msg.longitude;
    // Stamped on receipt so fix ages share the scheduler's clock
    sample.timestamp_ms = node_now_ms(node_);

    if (msg.position_covariance_type != sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN) {
        double variance = std::max(msg.position_covariance[0], msg.position_covariance[4]);
        if (variance >= 0.0) {
            sample.accuracy_m = std::sqrt(variance);
        }
    }
    return sample;
}

// ---------------------------------------------------------------------------
// ImuMotionSource
// ---------------------------------------------------------------------------

ImuMotionSource::ImuMotionSource(rclcpp::Node* node, bool available, double gravity_filter_alpha)
    : node_(node),
      available_(available),
      gravity_filter_alpha_(gravity_filter_alpha),
      next_listener_id_(1)
{
    imu_sub_ = node_->create_subscription<sensor_msgs::msg::Imu>(
        "imu/data", rclcpp::SensorDataQoS(),
        std::bind(&ImuMotionSource::imu_callback, this, _1));
}

SubscriptionHandle ImuMotionSource::subscribe(int64_t interval_ms, MotionCallback on_sample)
{
    uint64_t id = next_listener_id_++;
    listeners_[id] = Listener{interval_ms, std::move(on_sample), std::nullopt};
    return SubscriptionHandle([this, id]() { listeners_.erase(id); });
}

void ImuMotionSource::imu_callback(const sensor_msgs::msg::Imu::SharedPtr msg)
{
    if (!available_) return;

    geometry_msgs::msg::Vector3 raw;
    raw.x = msg->linear_acceleration.x / STANDARD_GRAVITY;
    raw.y = msg->linear_acceleration.y / STANDARD_GRAVITY;
    raw.z = msg->linear_acceleration.z / STANDARD_GRAVITY;

    // Low-pass gravity estimate, subtracted to leave user acceleration
    if (!gravity_) {
        gravity_ = raw;
    } else {
        gravity_->x = gravity_filter_alpha_ * gravity_->x + (1.0 - gravity_filter_alpha_) * raw.x;
        gravity_->y = gravity_filter_alpha_ * gravity_->y + (1.0 - gravity_filter_alpha_) * raw.y;
        gravity_->z = gravity_filter_alpha_ * gravity_->z + (1.0 - gravity_filter_alpha_) * raw.z;
    }

    geometry_msgs::msg::Vector3 acceleration;
    acceleration.x = raw.x - gravity_->x;
    acceleration.y = raw.y - gravity_->y;
    acceleration.z = raw.z - gravity_->z;

    int64_t now = node_now_ms(node_);
    std::vector<uint64_t> ids;
    for (const auto& entry : listeners_) {
        ids.push_back(entry.first);
    }

    for (uint64_t id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) continue;

        Listener& listener = it->second;
        if (listener.last_delivered_ms && now - *listener.last_delivered_ms < listener.interval_ms) {
            continue;
        }
        listener.last_delivered_ms = now;
        MotionCallback callback = listener.callback;
        callback(acceleration);
    }
}

// ---------------------------------------------------------------------------
// TopicLifecycleSource
// ---------------------------------------------------------------------------

TopicLifecycleSource::TopicLifecycleSource(rclcpp::Node* node)
    : next_listener_id_(1)
{
    foreground_sub_ = node->create_subscription<std_msgs::msg::Bool>(
        "app/foreground", 10, std::bind(&TopicLifecycleSource::foreground_callback, this, _1));
}

SubscriptionHandle TopicLifecycleSource::subscribe(std::function<void(AppState)> on_change)
{
    uint64_t id = next_listener_id_++;
    listeners_[id] = std::move(on_change);
    return SubscriptionHandle([this, id]() { listeners_.erase(id); });
}

void TopicLifecycleSource::foreground_callback(const std_msgs::msg::Bool::SharedPtr msg)
{
    AppState state = msg->data ? AppState::ACTIVE : AppState::BACKGROUND;
    if (last_state_ && *last_state_ == state) return;
    last_state_ = state;

    auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        if (listeners_.count(entry.first)) entry.second(state);
    }
}

// ---------------------------------------------------------------------------
// TopicSpeechBridge
// ---------------------------------------------------------------------------

TopicSpeechBridge::TopicSpeechBridge(rclcpp::Node* node)
    : node_(node)
{
    say_pub_ = node_->create_publisher<std_msgs::msg::String>("voice/say", 10);
    play_pub_ = node_->create_publisher<std_msgs::msg::String>("voice/play_file", 10);
    stop_pub_ = node_->create_publisher<std_msgs::msg::Empty>("voice/stop", 10);

    done_sub_ = node_->create_subscription<std_msgs::msg::Empty>(
        "voice/done", 10, std::bind(&TopicSpeechBridge::done_callback, this, _1));
    error_sub_ = node_->create_subscription<std_msgs::msg::String>(
        "voice/error", 10, std::bind(&TopicSpeechBridge::error_callback, this, _1));
}

void TopicSpeechBridge::speak(const std::string& text, const VoiceOptions& options,
                              std::function<void()> on_done,
                              std::function<void(const std::string&)> on_error,
                              std::function<void()> on_stopped)
{
    std::optional<PendingRequest> previous = std::move(pending_);
    pending_ = PendingRequest{std::move(on_done), std::move(on_error), std::move(on_stopped)};

    RCLCPP_DEBUG(node_->get_logger(), "Say [%s rate=%.2f pitch=%.2f]: %s",
        options.language.c_str(), options.rate, options.pitch, text.c_str());

    std_msgs::msg::String msg;
    msg.data = text;
    say_pub_->publish(msg);

    // A superseded request counts as stopped
    if (previous && previous->on_stopped) previous->on_stopped();
}

void TopicSpeechBridge::play(const std::string& path, std::function<void(bool ok)> on_finished)
{
    pending_ = PendingRequest{
        [on_finished]() { on_finished(true); },
        [on_finished](const std::string&) { on_finished(false); },
        nullptr};

    std_msgs::msg::String msg;
    msg.data = path;
    play_pub_->publish(msg);
}

void TopicSpeechBridge::stop()
{
    stop_pub_->publish(std_msgs::msg::Empty());

    std::optional<PendingRequest> request = std::move(pending_);
    pending_.reset();
    if (request && request->on_stopped) request->on_stopped();
}

void TopicSpeechBridge::done_callback(const std_msgs::msg::Empty::SharedPtr /*msg*/)
{
    std::optional<PendingRequest> request = std::move(pending_);
    pending_.reset();
    if (request && request->on_done) request->on_done();
}

void TopicSpeechBridge::error_callback(const std_msgs::msg::String::SharedPtr msg)
{
    std::optional<PendingRequest> request = std::move(pending_);
    pending_.reset();
    if (request && request->on_error) request->on_error(msg->data);
}
