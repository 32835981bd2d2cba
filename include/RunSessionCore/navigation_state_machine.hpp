#ifndef NAVIGATION_STATE_MACHINE_HPP_
#define NAVIGATION_STATE_MACHINE_HPP_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "RunSessionCore/types.hpp"
#include "RunSessionCore/route_preprocessor.hpp"

/**
 * Snapshot of turn-by-turn progress.
 */
struct NavigationState
{
    size_t current_waypoint_index = 0;
    double distance_to_next_turn_m = 0.0;
    std::string next_instruction;
    bool is_off_route = false;
    bool has_announced_90m = false;
    bool has_announced_35m = false;
    bool has_announced_passed_turn = false;
    double distance_covered_m = 0.0;   // Last run distance reported by the caller
};

/**
 * Guidance produced while following the route.
 */
struct GuidanceEvent
{
    enum Type {
        APPROACH_FAR,         // First warning at the far threshold
        APPROACH_NEAR,        // Bare turn phrase at the near threshold
        WAYPOINT_REACHED,
        DESTINATION_REACHED,
        PASSED_TURN,
        OFF_ROUTE
    };

    Type type;
    size_t waypoint_index;    // Waypoint the event refers to
    std::string text;         // Spoken text; empty when nothing should be said
};

/**
 * Turn-by-turn navigation over a preprocessed route.
 * Pure reducer over position updates: no timers, no I/O. Updates must be
 * applied in arrival order.
 */
class NavigationStateMachine
{
public:
    /**
     * Navigation thresholds in meters.
     */
    struct NavigationParams
    {
        double turn_grouping_distance;   // Turn grouping radius during preprocessing
        double approach_far_distance;    // "In N meters" announcement
        double approach_near_distance;   // Bare turn phrase announcement
        double waypoint_reached_distance;
        double passed_turn_margin;       // Beyond near distance + margin after near announcement
        double off_route_threshold;      // Distance to nearest waypoint
        double protected_ratio;          // Route progress ratio for protection

        NavigationParams()
            : turn_grouping_distance(150.0),
              approach_far_distance(90.0),
              approach_near_distance(35.0),
              waypoint_reached_distance(25.0),
              passed_turn_margin(20.0),
              off_route_threshold(50.0),
              protected_ratio(0.6)
        {}
    };

    using GuidanceCallback = std::function<void(const GuidanceEvent&)>;
    using StateCallback = std::function<void(const NavigationState&)>;

    /**
     * @param on_guidance Receives every guidance event (typically forwarded to the voice queue)
     */
    explicit NavigationStateMachine(GuidanceCallback on_guidance = nullptr,
                                    const NavigationParams& params = NavigationParams());

    /**
     * Preprocess the route and reset all progress.
     *
     * @param waypoints Raw route waypoints in order
     * @param total_distance_m Total route length in meters
     * @param on_state_change Invoked after every position update
     */
    void initialize(const std::vector<RouteWaypoint>& waypoints,
                    double total_distance_m,
                    StateCallback on_state_change = nullptr);

    /**
     * Apply one validated position.
     *
     * @param latitude Current latitude (degrees)
     * @param longitude Current longitude (degrees)
     * @param distance_covered_m Run distance so far (meters)
     * @return Updated state snapshot
     */
    NavigationState update_position(double latitude, double longitude, double distance_covered_m);

    NavigationState state() const { return state_; }
    std::string current_instruction() const { return state_.next_instruction; }
    double distance_to_next_turn() const { return state_.distance_to_next_turn_m; }
    bool is_off_route() const { return state_.is_off_route; }
    size_t remaining_waypoints() const;
    const std::vector<RouteWaypoint>& waypoints() const { return waypoints_; }

    // Back to the pre-initialize condition
    void reset();

private:
    void advance_to_next_waypoint();
    void handle_passed_turn(const RouteWaypoint& waypoint);
    void check_off_route(double latitude, double longitude);
    double find_min_distance_to_route(double latitude, double longitude) const;
    void recalibrate_to_nearest_waypoint(double latitude, double longitude);
    void clear_waypoint_flags();
    void emit(GuidanceEvent::Type type, const std::string& text);

    NavigationParams params_;
    RoutePreprocessor preprocessor_;
    GuidanceCallback on_guidance_;
    StateCallback on_state_change_;

    std::vector<RouteWaypoint> waypoints_;
    NavigationState state_;
    double route_total_distance_;
};

#endif // NAVIGATION_STATE_MACHINE_HPP_
