#include "RunSessionCore/navigation_state_machine.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>
#include "RunSessionCore/geo.hpp"
#include "rclcpp/rclcpp.hpp"

namespace
{
const rclcpp::Logger LOGGER = rclcpp::get_logger("navigation");

const char* const DESTINATION_INSTRUCTION = "You have reached your destination";
const char* const DESTINATION_ANNOUNCEMENT = "You have reached your destination. Great job!";
const char* const OFF_ROUTE_ANNOUNCEMENT = "You appear to be off route. Recalculating.";
}  // namespace

NavigationStateMachine::NavigationStateMachine(GuidanceCallback on_guidance,
                                               const NavigationParams& params)
    : params_(params),
      preprocessor_(params.turn_grouping_distance, params.protected_ratio),
      on_guidance_(std::move(on_guidance)),
      route_total_distance_(0.0)
{
}

void NavigationStateMachine::initialize(const std::vector<RouteWaypoint>& waypoints,
                                        double total_distance_m,
                                        StateCallback on_state_change)
{
    waypoints_ = preprocessor_.process(waypoints, total_distance_m);
    route_total_distance_ = total_distance_m;
    state_ = NavigationState();
    on_state_change_ = std::move(on_state_change);

    if (!waypoints_.empty()) {
        state_.next_instruction = waypoints_.front().instruction;
    }

    RCLCPP_INFO(LOGGER, "Navigation initialized: %zu waypoints over %.0fm",
        waypoints_.size(), route_total_distance_);
}

NavigationState NavigationStateMachine::update_position(double latitude, double longitude,
                                                        double distance_covered_m)
{
    state_.distance_covered_m = distance_covered_m;

    if (waypoints_.empty() || state_.current_waypoint_index >= waypoints_.size()) {
        return state_;
    }

    const RouteWaypoint current = waypoints_[state_.current_waypoint_index];
    double distance = haversine_distance(latitude, longitude, current.latitude, current.longitude);
    state_.distance_to_next_turn_m = distance;

    if (distance <= params_.approach_far_distance && !state_.has_announced_90m) {
        long rounded = static_cast<long>(std::floor(distance / 10.0 + 0.5)) * 10;
        emit(GuidanceEvent::APPROACH_FAR,
             "In " + std::to_string(rounded) + " meters, " + direction_phrase(current.direction));
        state_.has_announced_90m = true;
    }

    if (distance <= params_.approach_near_distance && !state_.has_announced_35m) {
        emit(GuidanceEvent::APPROACH_NEAR, direction_phrase(current.direction));
        state_.has_announced_35m = true;
    }

    // Reached takes precedence; passed-turn is only considered outside the reached radius
    if (distance <= params_.waypoint_reached_distance) {
        advance_to_next_waypoint();
    } else if (state_.has_announced_35m &&
               distance > params_.approach_near_distance + params_.passed_turn_margin &&
               !current.is_protected) {
        handle_passed_turn(current);
    }

    check_off_route(latitude, longitude);

    if (on_state_change_) {
        on_state_change_(state_);
    }
    return state_;
}

void NavigationStateMachine::advance_to_next_waypoint()
{
    size_t reached = state_.current_waypoint_index;
    emit(GuidanceEvent::WAYPOINT_REACHED, "");

    state_.current_waypoint_index = reached + 1;
    clear_waypoint_flags();

    if (state_.current_waypoint_index < waypoints_.size()) {
        state_.next_instruction = waypoints_[state_.current_waypoint_index].instruction;
        RCLCPP_INFO(LOGGER, "Waypoint %zu reached, next: %s",
            reached, state_.next_instruction.c_str());
    } else {
        state_.next_instruction = DESTINATION_INSTRUCTION;
        RCLCPP_INFO(LOGGER, "Destination reached");
        emit(GuidanceEvent::DESTINATION_REACHED, DESTINATION_ANNOUNCEMENT);
    }
}

void NavigationStateMachine::handle_passed_turn(const RouteWaypoint& waypoint)
{
    if (state_.has_announced_passed_turn) return;

    state_.has_announced_passed_turn = true;
    RCLCPP_INFO(LOGGER, "Possible missed turn at waypoint %zu", state_.current_waypoint_index);
    emit(GuidanceEvent::PASSED_TURN, "You may have passed your turn. " + waypoint.instruction);
}

void NavigationStateMachine::check_off_route(double latitude, double longitude)
{
    double min_distance = find_min_distance_to_route(latitude, longitude);

    if (min_distance > params_.off_route_threshold) {
        // Announce only on the rising edge of an excursion
        if (!state_.is_off_route) {
            state_.is_off_route = true;
            RCLCPP_WARN(LOGGER, "Off route: %.0fm from nearest waypoint", min_distance);
            emit(GuidanceEvent::OFF_ROUTE, OFF_ROUTE_ANNOUNCEMENT);
            recalibrate_to_nearest_waypoint(latitude, longitude);
        }
    } else {
        if (state_.is_off_route) {
            RCLCPP_INFO(LOGGER, "Back on route");
        }
        state_.is_off_route = false;
    }
}

double NavigationStateMachine::find_min_distance_to_route(double latitude, double longitude) const
{
    double min_distance = std::numeric_limits<double>::infinity();

    for (const auto& wp : waypoints_) {
        double d = haversine_distance(latitude, longitude, wp.latitude, wp.longitude);
        min_distance = std::min(min_distance, d);
    }

    return min_distance;
}

// Jump forward to the closest remaining waypoint
void NavigationStateMachine::recalibrate_to_nearest_waypoint(double latitude, double longitude)
{
    size_t nearest_index = state_.current_waypoint_index;
    double min_distance = std::numeric_limits<double>::infinity();

    for (size_t i = state_.current_waypoint_index; i < waypoints_.size(); ++i) {
        double d = haversine_distance(latitude, longitude,
                                      waypoints_[i].latitude, waypoints_[i].longitude);
        if (d < min_distance) {
            min_distance = d;
            nearest_index = i;
        }
    }

    if (nearest_index != state_.current_waypoint_index) {
        RCLCPP_INFO(LOGGER, "Recalibrated from waypoint %zu to %zu",
            state_.current_waypoint_index, nearest_index);
        state_.current_waypoint_index = nearest_index;
        clear_waypoint_flags();
        state_.next_instruction = waypoints_[nearest_index].instruction;
    }
}

void NavigationStateMachine::clear_waypoint_flags()
{
    state_.has_announced_90m = false;
    state_.has_announced_35m = false;
    state_.has_announced_passed_turn = false;
}

void NavigationStateMachine::emit(GuidanceEvent::Type type, const std::string& text)
{
    if (!on_guidance_) return;

    GuidanceEvent event;
    event.type = type;
    event.waypoint_index = std::min(state_.current_waypoint_index,
                                    waypoints_.empty() ? size_t{0} : waypoints_.size() - 1);
    event.text = text;
    on_guidance_(event);
}

size_t NavigationStateMachine::remaining_waypoints() const
{
    if (state_.current_waypoint_index >= waypoints_.size()) return 0;
    return waypoints_.size() - state_.current_waypoint_index;
}

void NavigationStateMachine::reset()
{
    waypoints_.clear();
    state_ = NavigationState();
    route_total_distance_ = 0.0;
    on_state_change_ = nullptr;
}
