#include "RunSessionCore/route_preprocessor.hpp"
#include <algorithm>
#include <cctype>
#include "RunSessionCore/geo.hpp"
#include "rclcpp/rclcpp.hpp"

namespace
{
bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}
}  // namespace

TurnDirection classify_instruction(const std::string& instruction)
{
    std::string lower(instruction);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains(lower, "destination") || contains(lower, "finish") || contains(lower, "arrived")) {
        return TurnDirection::DESTINATION;
    }
    if (contains(lower, "u-turn") || contains(lower, "make a u")) {
        return TurnDirection::U_TURN;
    }
    if (contains(lower, "left")) {
        return TurnDirection::LEFT;
    }
    if (contains(lower, "right")) {
        return TurnDirection::RIGHT;
    }
    return TurnDirection::STRAIGHT;
}

std::string direction_phrase(TurnDirection direction)
{
    switch (direction) {
        case TurnDirection::LEFT:
            return "turn left";
        case TurnDirection::RIGHT:
            return "turn right";
        case TurnDirection::U_TURN:
            return "make a U-turn";
        case TurnDirection::DESTINATION:
            return "your destination is ahead";
        case TurnDirection::STRAIGHT:
        default:
            return "continue straight";
    }
}

RoutePreprocessor::RoutePreprocessor(double grouping_distance_m, double protected_ratio)
    : grouping_distance_m_(grouping_distance_m),
      protected_ratio_(protected_ratio)
{
}

std::vector<RouteWaypoint> RoutePreprocessor::process(
    const std::vector<RouteWaypoint>& waypoints,
    double total_distance_m) const
{
    std::vector<RouteWaypoint> processed;
    if (waypoints.empty()) {
        return processed;
    }

    // Without a usable total, measure progress against the last waypoint
    double reference_distance = total_distance_m;
    if (reference_distance <= 0.0) {
        reference_distance = waypoints.back().distance_from_start_m;
        RCLCPP_WARN(rclcpp::get_logger("navigation"),
            "Route total distance %.1fm invalid, using %.1fm",
            total_distance_m, reference_distance);
    }

    for (const auto& wp : waypoints) {
        // Turn grouping: skip manoeuvres too close to the last retained one
        if (!processed.empty()) {
            const RouteWaypoint& last = processed.back();
            double gap = haversine_distance(
                last.latitude, last.longitude, wp.latitude, wp.longitude);
            if (gap < grouping_distance_m_) {
                continue;
            }
        }

        RouteWaypoint retained = wp;
        retained.direction = classify_instruction(wp.instruction);
        retained.is_protected = reference_distance > 0.0 &&
            (wp.distance_from_start_m / reference_distance) >= protected_ratio_;
        processed.push_back(retained);
    }

    RCLCPP_INFO(rclcpp::get_logger("navigation"),
        "Route preprocessed: %zu of %zu waypoints retained",
        processed.size(), waypoints.size());

    return processed;
}
