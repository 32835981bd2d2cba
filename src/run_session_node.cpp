/**
 * Run Session Node
 *
 * Live-session core of a running app: supervises the GPS stream, drives
 * turn-by-turn guidance along a precomputed route, serializes all spoken
 * announcements onto one audio channel and estimates running cadence.
 */

#include "rclcpp/rclcpp.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "std_msgs/msg/float64.hpp"
#include "std_msgs/msg/string.hpp"

#include "RunSessionCore/types.hpp"
#include "RunSessionCore/geo.hpp"
#include "RunSessionCore/ros_scheduler.hpp"
#include "RunSessionCore/ros_capabilities.hpp"
#include "RunSessionCore/location_health_monitor.hpp"
#include "RunSessionCore/navigation_state_machine.hpp"
#include "RunSessionCore/voice_announcement_queue.hpp"
#include "RunSessionCore/cadence_estimator.hpp"

using std::placeholders::_1;
using namespace std::chrono_literals;

namespace
{
const char* health_status_name(HealthStatus status)
{
    switch (status) {
        case HealthStatus::HEALTHY:    return "healthy";
        case HealthStatus::STALE:      return "stale";
        case HealthStatus::RECOVERING: return "recovering";
        case HealthStatus::LOST:       return "lost";
    }
    return "unknown";
}
}  // namespace

class RunSessionNode : public rclcpp::Node
{
public:
    RunSessionNode() : Node("run_session"), scheduler_(this), is_configured_(false)
    {
        // Declare and load ROS parameters
        this->declare_parameter<bool>("location.permission_granted", true);
        this->declare_parameter<int>("location.health_check_interval_ms", 10000);
        this->declare_parameter<int>("location.staleness_threshold_ms", 15000);
        this->declare_parameter<int>("location.max_recovery_attempts", 5);
        this->declare_parameter<double>("location.max_speed_mps", 12.5);
        this->declare_parameter<double>("location.max_accuracy_m", 50.0);
        this->declare_parameter<int>("location.window_size", 5);
        this->declare_parameter<int>("location.settle_delay_ms", 1000);
        this->declare_parameter<int>("location.fetch_timeout_ms", 15000);
        this->declare_parameter<int>("location.min_interval_ms", 1000);
        this->declare_parameter<double>("location.min_distance_m", 5.0);

        this->declare_parameter<double>("navigation.turn_grouping_distance", 150.0);
        this->declare_parameter<double>("navigation.approach_far_distance", 90.0);
        this->declare_parameter<double>("navigation.approach_near_distance", 35.0);
        this->declare_parameter<double>("navigation.waypoint_reached_distance", 25.0);
        this->declare_parameter<double>("navigation.passed_turn_margin", 20.0);
        this->declare_parameter<double>("navigation.off_route_threshold", 50.0);
        this->declare_parameter<double>("navigation.protected_ratio", 0.6);

        this->declare_parameter<bool>("voice.enabled", true);
        this->declare_parameter<int>("voice.throttle_ms", 3000);
        this->declare_parameter<int>("voice.watchdog_timeout_ms", 45000);
        this->declare_parameter<std::string>("voice.temp_directory", "");
        this->declare_parameter<std::string>("voice.coach.gender", "female");
        this->declare_parameter<std::string>("voice.coach.accent", "american");
        this->declare_parameter<double>("voice.coach.rate", 0.9);
        this->declare_parameter<double>("voice.coach.pitch", 1.0);

        this->declare_parameter<bool>("cadence.enabled", true);
        this->declare_parameter<int>("cadence.sample_interval_ms", 50);
        this->declare_parameter<int>("cadence.report_interval_ms", 2000);
        this->declare_parameter<double>("cadence.min_peak_magnitude", 0.8);
        this->declare_parameter<double>("cadence.max_peak_magnitude", 3.5);
        this->declare_parameter<int>("cadence.min_step_interval_ms", 200);
        this->declare_parameter<int>("cadence.max_step_interval_ms", 1000);
        this->declare_parameter<int>("cadence.window_ms", 15000);
        this->declare_parameter<int>("cadence.max_spm", 220);
        this->declare_parameter<double>("cadence.gravity_filter_alpha", 0.8);

        this->declare_parameter<std::vector<double>>("route.latitudes", std::vector<double>{});
        this->declare_parameter<std::vector<double>>("route.longitudes", std::vector<double>{});
        this->declare_parameter<std::vector<std::string>>("route.instructions", std::vector<std::string>{});
        this->declare_parameter<std::vector<double>>("route.distances_from_start", std::vector<double>{});
        this->declare_parameter<double>("route.total_distance_m", 0.0);

        RCLCPP_INFO(this->get_logger(), "===========================================");
        RCLCPP_INFO(this->get_logger(), "  Run Session Core");
        RCLCPP_INFO(this->get_logger(), "===========================================");

        LocationHealthMonitor::MonitorParams monitor_params;
        monitor_params.health_check_interval_ms = this->get_parameter("location.health_check_interval_ms").as_int();
        monitor_params.staleness_threshold_ms = this->get_parameter("location.staleness_threshold_ms").as_int();
        monitor_params.max_recovery_attempts = this->get_parameter("location.max_recovery_attempts").as_int();
        monitor_params.max_speed_mps = this->get_parameter("location.max_speed_mps").as_double();
        monitor_params.max_accuracy_m = this->get_parameter("location.max_accuracy_m").as_double();
        monitor_params.window_size = this->get_parameter("location.window_size").as_int();
        monitor_params.settle_delay_ms = this->get_parameter("location.settle_delay_ms").as_int();
        monitor_params.fetch_timeout_ms = this->get_parameter("location.fetch_timeout_ms").as_int();
        monitor_params.subscription.min_interval_ms = this->get_parameter("location.min_interval_ms").as_int();
        monitor_params.subscription.min_distance_m = this->get_parameter("location.min_distance_m").as_double();

        NavigationStateMachine::NavigationParams nav_params;
        nav_params.turn_grouping_distance = this->get_parameter("navigation.turn_grouping_distance").as_double();
        nav_params.approach_far_distance = this->get_parameter("navigation.approach_far_distance").as_double();
        nav_params.approach_near_distance = this->get_parameter("navigation.approach_near_distance").as_double();
        nav_params.waypoint_reached_distance = this->get_parameter("navigation.waypoint_reached_distance").as_double();
        nav_params.passed_turn_margin = this->get_parameter("navigation.passed_turn_margin").as_double();
        nav_params.off_route_threshold = this->get_parameter("navigation.off_route_threshold").as_double();
        nav_params.protected_ratio = this->get_parameter("navigation.protected_ratio").as_double();

        VoiceAnnouncementQueue::VoiceQueueParams voice_params;
        voice_params.throttle_ms = this->get_parameter("voice.throttle_ms").as_int();
        voice_params.watchdog_timeout_ms = this->get_parameter("voice.watchdog_timeout_ms").as_int();
        voice_params.temp_directory = this->get_parameter("voice.temp_directory").as_string();

        CoachVoiceSettings coach_voice;
        coach_voice.gender = this->get_parameter("voice.coach.gender").as_string();
        coach_voice.accent = this->get_parameter("voice.coach.accent").as_string();
        coach_voice.rate = this->get_parameter("voice.coach.rate").as_double();
        coach_voice.pitch = this->get_parameter("voice.coach.pitch").as_double();

        CadenceEstimator::CadenceParams cadence_params;
        cadence_params.sample_interval_ms = this->get_parameter("cadence.sample_interval_ms").as_int();
        cadence_params.report_interval_ms = this->get_parameter("cadence.report_interval_ms").as_int();
        cadence_params.detector.min_peak_magnitude = this->get_parameter("cadence.min_peak_magnitude").as_double();
        cadence_params.detector.max_peak_magnitude = this->get_parameter("cadence.max_peak_magnitude").as_double();
        cadence_params.detector.min_step_interval_ms = this->get_parameter("cadence.min_step_interval_ms").as_int();
        cadence_params.detector.max_step_interval_ms = this->get_parameter("cadence.max_step_interval_ms").as_int();
        cadence_params.detector.window_ms = this->get_parameter("cadence.window_ms").as_int();
        cadence_params.detector.max_spm = this->get_parameter("cadence.max_spm").as_int();

        if (!validate_params(monitor_params, nav_params, voice_params, cadence_params)) {
            return;
        }

        std::vector<RouteWaypoint> route;
        double route_total_distance = 0.0;
        if (!load_route(route, route_total_distance)) {
            return;
        }

        // Capabilities
        position_source_ = std::make_unique<NavSatFixPositionSource>(
            this, this->get_parameter("location.permission_granted").as_bool());
        motion_source_ = std::make_unique<ImuMotionSource>(
            this, this->get_parameter("cadence.enabled").as_bool(),
            this->get_parameter("cadence.gravity_filter_alpha").as_double());
        lifecycle_source_ = std::make_unique<TopicLifecycleSource>(this);
        speech_bridge_ = std::make_unique<TopicSpeechBridge>(this);

        // Session components
        voice_queue_ = std::make_unique<VoiceAnnouncementQueue>(
            scheduler_, *speech_bridge_, nullptr, speech_bridge_.get(), voice_params);
        voice_queue_->set_coach_voice_settings(coach_voice);
        voice_queue_->set_enabled(this->get_parameter("voice.enabled").as_bool());

        navigation_ = std::make_unique<NavigationStateMachine>(
            [this](const GuidanceEvent& event) {
                if (!event.text.empty()) voice_queue_->enqueue_navigation(event.text);
            },
            nav_params);
        if (!route.empty()) {
            navigation_->initialize(route, route_total_distance,
                std::bind(&RunSessionNode::publish_navigation_state, this, _1));
        }

        location_monitor_ = std::make_unique<LocationHealthMonitor>(
            *position_source_, lifecycle_source_.get(), scheduler_, monitor_params);
        cadence_ = std::make_unique<CadenceEstimator>(*motion_source_, scheduler_, cadence_params);

        // Setup ROS publishers and subscribers
        cadence_pub_ = this->create_publisher<std_msgs::msg::Float64>("run/cadence", 10);
        instruction_pub_ = this->create_publisher<std_msgs::msg::String>("run/navigation/instruction", 10);
        gps_status_pub_ = this->create_publisher<std_msgs::msg::String>("run/gps_status", 10);

        coach_sub_ = this->create_subscription<std_msgs::msg::String>(
            "voice/coach", 10, std::bind(&RunSessionNode::coach_callback, this, _1));
        system_sub_ = this->create_subscription<std_msgs::msg::String>(
            "voice/system", 10, std::bind(&RunSessionNode::system_callback, this, _1));

        LocationMonitorCallbacks callbacks;
        callbacks.on_location_update = std::bind(&RunSessionNode::location_callback, this, _1);
        callbacks.on_recovery_started = [this]() { this->publish_gps_status(); };
        callbacks.on_recovery_success = [this]() { this->publish_gps_status(); };
        callbacks.on_recovery_failed = [this]() {
            RCLCPP_WARN(this->get_logger(), "GPS recovery exhausted");
        };
        callbacks.on_gps_lost = [this]() {
            this->publish_gps_status();
            voice_queue_->enqueue_system("GPS signal lost. Please check your location settings.");
        };

        if (!location_monitor_->start(callbacks)) {
            RCLCPP_WARN(this->get_logger(), "Location monitoring unavailable, navigation disabled");
        }

        if (!cadence_->start(std::bind(&RunSessionNode::cadence_callback, this, _1))) {
            RCLCPP_WARN(this->get_logger(), "Cadence estimation unavailable");
        }

        status_timer_ = this->create_wall_timer(
            1s, std::bind(&RunSessionNode::publish_gps_status, this));

        is_configured_ = true;
        RCLCPP_INFO(this->get_logger(), "Session ready: %zu route waypoints",
                    navigation_->waypoints().size());
    }

    ~RunSessionNode() override
    {
        if (location_monitor_) location_monitor_->stop();
        if (cadence_) cadence_->stop();
        if (voice_queue_) voice_queue_->set_enabled(false);
    }

    bool is_configured() const { return is_configured_; }

private:
    // Reject non-positive thresholds and intervals
    bool validate_params(const LocationHealthMonitor::MonitorParams& monitor,
                         const NavigationStateMachine::NavigationParams& nav,
                         const VoiceAnnouncementQueue::VoiceQueueParams& voice,
                         const CadenceEstimator::CadenceParams& cadence)
    {
        std::vector<std::string> errors;

        if (monitor.health_check_interval_ms <= 0) errors.push_back("location.health_check_interval_ms");
        if (monitor.staleness_threshold_ms <= 0) errors.push_back("location.staleness_threshold_ms");
        if (monitor.max_recovery_attempts <= 0) errors.push_back("location.max_recovery_attempts");
        if (monitor.max_speed_mps <= 0.0) errors.push_back("location.max_speed_mps");
        if (monitor.max_accuracy_m <= 0.0) errors.push_back("location.max_accuracy_m");
        if (monitor.window_size == 0) errors.push_back("location.window_size");
        if (monitor.settle_delay_ms < 0) errors.push_back("location.settle_delay_ms");
        if (monitor.fetch_timeout_ms <= 0) errors.push_back("location.fetch_timeout_ms");

        if (nav.approach_far_distance <= 0.0) errors.push_back("navigation.approach_far_distance");
        if (nav.approach_near_distance <= 0.0) errors.push_back("navigation.approach_near_distance");
        if (nav.waypoint_reached_distance <= 0.0) errors.push_back("navigation.waypoint_reached_distance");
        if (nav.off_route_threshold <= 0.0) errors.push_back("navigation.off_route_threshold");
        if (nav.protected_ratio < 0.0 || nav.protected_ratio > 1.0) errors.push_back("navigation.protected_ratio");

        if (voice.throttle_ms < 0) errors.push_back("voice.throttle_ms");
        if (voice.watchdog_timeout_ms <= 0) errors.push_back("voice.watchdog_timeout_ms");

        if (cadence.sample_interval_ms <= 0) errors.push_back("cadence.sample_interval_ms");
        if (cadence.report_interval_ms <= 0) errors.push_back("cadence.report_interval_ms");
        if (cadence.detector.window_ms <= 0) errors.push_back("cadence.window_ms");
        if (cadence.detector.min_step_interval_ms > cadence.detector.max_step_interval_ms) {
            errors.push_back("cadence.min_step_interval_ms");
        }

        for (const auto& name : errors) {
            RCLCPP_ERROR(this->get_logger(), "Invalid parameter: %s", name.c_str());
        }
        return errors.empty();
    }

    // Build the route from parallel parameter arrays
    bool load_route(std::vector<RouteWaypoint>& route, double& total_distance)
    {
        auto latitudes = this->get_parameter("route.latitudes").as_double_array();
        auto longitudes = this->get_parameter("route.longitudes").as_double_array();
        auto instructions = this->get_parameter("route.instructions").as_string_array();
        auto distances = this->get_parameter("route.distances_from_start").as_double_array();
        total_distance = this->get_parameter("route.total_distance_m").as_double();

        if (latitudes.size() != longitudes.size() || latitudes.size() != instructions.size()) {
            RCLCPP_ERROR(this->get_logger(),
                "Route arrays differ in length: %zu latitudes, %zu longitudes, %zu instructions",
                latitudes.size(), longitudes.size(), instructions.size());
            return false;
        }
        if (!distances.empty() && distances.size() != latitudes.size()) {
            RCLCPP_ERROR(this->get_logger(), "route.distances_from_start has %zu entries, expected %zu",
                distances.size(), latitudes.size());
            return false;
        }

        double cumulative = 0.0;
        for (size_t i = 0; i < latitudes.size(); ++i) {
            RouteWaypoint waypoint;
            waypoint.latitude = latitudes[i];
            waypoint.longitude = longitudes[i];
            waypoint.instruction = instructions[i];

            // Without explicit distances, measure along the waypoint chain
            if (distances.empty()) {
                if (i > 0) {
                    cumulative += haversine_distance(latitudes[i - 1], longitudes[i - 1],
                                                     latitudes[i], longitudes[i]);
                }
                waypoint.distance_from_start_m = cumulative;
            } else {
                waypoint.distance_from_start_m = distances[i];
            }
            route.push_back(waypoint);
        }

        if (route.empty()) {
            RCLCPP_INFO(this->get_logger(), "No route configured, guidance disabled");
        }
        return true;
    }

    // Feed accepted fixes into navigation and accumulate run distance
    void location_callback(const PositionSample& sample)
    {
        if (last_accepted_) {
            distance_covered_m_ += haversine_distance(
                last_accepted_->latitude, last_accepted_->longitude,
                sample.latitude, sample.longitude);
        }
        last_accepted_ = sample;

        if (navigation_->waypoints().empty()) return;

        std::optional<PositionSample> smoothed = location_monitor_->smoothed_location();
        const PositionSample& position = smoothed ? *smoothed : sample;
        navigation_->update_position(position.latitude, position.longitude, distance_covered_m_);
    }

    void publish_navigation_state(const NavigationState& state)
    {
        if (state.next_instruction == last_published_instruction_) return;

        last_published_instruction_ = state.next_instruction;
        std_msgs::msg::String msg;
        msg.data = state.next_instruction;
        instruction_pub_->publish(msg);
    }

    void publish_gps_status()
    {
        std_msgs::msg::String msg;
        msg.data = health_status_name(location_monitor_->health_status());
        gps_status_pub_->publish(msg);
    }

    void cadence_callback(int spm)
    {
        std_msgs::msg::Float64 msg;
        msg.data = spm;
        cadence_pub_->publish(msg);
    }

    void coach_callback(const std_msgs::msg::String::SharedPtr msg)
    {
        voice_queue_->enqueue_coach(msg->data);
    }

    void system_callback(const std_msgs::msg::String::SharedPtr msg)
    {
        voice_queue_->enqueue_system(msg->data);
    }

    // Member variables; the scheduler and capabilities outlive the components
    RclcppScheduler scheduler_;
    std::unique_ptr<NavSatFixPositionSource> position_source_;
    std::unique_ptr<ImuMotionSource> motion_source_;
    std::unique_ptr<TopicLifecycleSource> lifecycle_source_;
    std::unique_ptr<TopicSpeechBridge> speech_bridge_;

    std::unique_ptr<VoiceAnnouncementQueue> voice_queue_;
    std::unique_ptr<NavigationStateMachine> navigation_;
    std::unique_ptr<LocationHealthMonitor> location_monitor_;
    std::unique_ptr<CadenceEstimator> cadence_;

    rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr cadence_pub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr instruction_pub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr gps_status_pub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr coach_sub_;
    rclcpp::Subscription<std_msgs::msg::String>::SharedPtr system_sub_;
    rclcpp::TimerBase::SharedPtr status_timer_;

    std::optional<PositionSample> last_accepted_;
    double distance_covered_m_ = 0.0;
    std::string last_published_instruction_;
    bool is_configured_;
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<RunSessionNode>();
    if (!node->is_configured()) {
        RCLCPP_ERROR(node->get_logger(), "Invalid configuration, shutting down");
        rclcpp::shutdown();
        return 1;
    }
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
