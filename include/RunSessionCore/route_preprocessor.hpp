#ifndef ROUTE_PREPROCESSOR_HPP_
#define ROUTE_PREPROCESSOR_HPP_

#include <string>
#include <vector>
#include "RunSessionCore/types.hpp"

/**
 * Classify a turn instruction into a manoeuvre category.
 * Keyword priority: destination > u-turn > left > right > straight.
 */
TurnDirection classify_instruction(const std::string& instruction);

/**
 * Spoken phrase for a manoeuvre ("turn left", "make a U-turn", ...).
 */
std::string direction_phrase(TurnDirection direction);

/**
 * Route preprocessing run once at navigation start.
 * Groups nearby turns, infers directions and marks the waypoints near the
 * finish as protected from missed-turn detection.
 */
class RoutePreprocessor
{
public:
    /**
     * @param grouping_distance_m Waypoints closer than this to the previously retained one are dropped
     * @param protected_ratio Progress ratio from which waypoints are protected
     */
    RoutePreprocessor(double grouping_distance_m = 150.0, double protected_ratio = 0.6);

    /**
     * Build the immutable waypoint list for a navigation session.
     *
     * @param waypoints Raw waypoints in route order
     * @param total_distance_m Total route length; non-positive falls back to the last waypoint's distance
     * @return Retained waypoints with direction and protection filled in
     */
    std::vector<RouteWaypoint> process(
        const std::vector<RouteWaypoint>& waypoints,
        double total_distance_m) const;

private:
    double grouping_distance_m_;
    double protected_ratio_;
};

#endif // ROUTE_PREPROCESSOR_HPP_
