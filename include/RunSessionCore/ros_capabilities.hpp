#ifndef RUN_SESSION_ROS_CAPABILITIES_HPP_
#define RUN_SESSION_ROS_CAPABILITIES_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "RunSessionCore/capabilities.hpp"
#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/vector3.hpp"
#include "sensor_msgs/msg/imu.hpp"
#include "sensor_msgs/msg/nav_sat_fix.hpp"
#include "std_msgs/msg/bool.hpp"
#include "std_msgs/msg/empty.hpp"
#include "std_msgs/msg/string.hpp"

/**
 * Positioning from sensor_msgs/NavSatFix on "fix".
 */
class NavSatFixPositionSource : public PositionSource
{
public:
    /**
     * @param node Node that owns the subscription
     * @param permission_granted Location permission as configured for this device
     */
    NavSatFixPositionSource(rclcpp::Node* node, bool permission_granted);

    PermissionStatus request_permission() override;
    SubscriptionHandle subscribe(const PositionSubscriptionOptions& options,
                                 PositionCallback on_sample) override;
    void fetch_once(LocationAccuracy accuracy, PositionFetchCallback on_result) override;

private:
    struct Listener
    {
        PositionSubscriptionOptions options;
        PositionCallback callback;
        std::optional<PositionSample> last_delivered;
    };

    void fix_callback(const sensor_msgs::msg::NavSatFix::SharedPtr msg);
    std::optional<PositionSample> to_sample(const sensor_msgs::msg::NavSatFix& msg) const;

    rclcpp::Node* node_;
    bool permission_granted_;
    rclcpp::Subscription<sensor_msgs::msg::NavSatFix>::SharedPtr fix_sub_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_;
    std::vector<PositionFetchCallback> pending_fetches_;
};

/**
 * Motion from sensor_msgs/Imu on "imu/data".
 * Linear acceleration is converted to g with gravity removed by a
 * low-pass estimate.
 */
class ImuMotionSource : public MotionSource
{
public:
    /**
     * @param node Node that owns the subscription
     * @param available Whether this device has a motion sensor
     * @param gravity_filter_alpha Low-pass factor of the gravity estimate (0..1)
     */
    ImuMotionSource(rclcpp::Node* node, bool available, double gravity_filter_alpha = 0.8);

    bool is_available() override { return available_; }
    SubscriptionHandle subscribe(int64_t interval_ms, MotionCallback on_sample) override;

private:
    struct Listener
    {
        int64_t interval_ms;
        MotionCallback callback;
        std::optional<int64_t> last_delivered_ms;
    };

    void imu_callback(const sensor_msgs::msg::Imu::SharedPtr msg);

    rclcpp::Node* node_;
    bool available_;
    double gravity_filter_alpha_;
    rclcpp::Subscription<sensor_msgs::msg::Imu>::SharedPtr imu_sub_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_;
    std::optional<geometry_msgs::msg::Vector3> gravity_;
};

/**
 * Foreground/background transitions from std_msgs/Bool on "app/foreground".
 */
class TopicLifecycleSource : public LifecycleSource
{
public:
    explicit TopicLifecycleSource(rclcpp::Node* node);

    SubscriptionHandle subscribe(std::function<void(AppState)> on_change) override;

private:
    void foreground_callback(const std_msgs::msg::Bool::SharedPtr msg);

    rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr foreground_sub_;
    std::map<uint64_t, std::function<void(AppState)>> listeners_;
    uint64_t next_listener_id_;
    std::optional<AppState> last_state_;
};

/**
 * Speech output through an external audio process.
 * Text goes out on "voice/say", audio file paths on "voice/play_file" and
 * stop requests on "voice/stop". The process answers every request with
 * "voice/done" or "voice/error". One request is outstanding at a time.
 */
class TopicSpeechBridge : public DeviceSpeech, public AudioPlayer
{
public:
    explicit TopicSpeechBridge(rclcpp::Node* node);

    void speak(const std::string& text, const VoiceOptions& options,
               std::function<void()> on_done,
               std::function<void(const std::string&)> on_error,
               std::function<void()> on_stopped) override;
    void play(const std::string& path, std::function<void(bool ok)> on_finished) override;
    void stop() override;

private:
    struct PendingRequest
    {
        std::function<void()> on_done;
        std::function<void(const std::string&)> on_error;
        std::function<void()> on_stopped;
    };

    void done_callback(const std_msgs::msg::Empty::SharedPtr msg);
    void error_callback(const std_msgs::msg::String::SharedPtr msg);

    rclcpp::Node* node_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr say_pub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr play_pub_;
    rclcpp::Publisher<std_msgs::msg::Empty>::SharedPtr stop_pub_;
    rclcpp::Subscription<std_msgs::msg::Empty>::SharedPtr done_sub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr error_sub_;
    std::optional<PendingRequest> pending_;
};

#endif // RUN_SESSION_ROS_CAPABILITIES_HPP_
