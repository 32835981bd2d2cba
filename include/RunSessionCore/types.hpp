#ifndef RUN_SESSION_TYPES_HPP_
#define RUN_SESSION_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

/**
 * Geographic fix as delivered by the positioning capability.
 * Immutable once captured; components copy it rather than hold references.
 */
struct PositionSample {
    double latitude;                    // Degrees, WGS84
    double longitude;                   // Degrees, WGS84
    int64_t timestamp_ms;               // Capture time in milliseconds
    std::optional<double> accuracy_m;   // Horizontal accuracy radius (meters)
    std::optional<double> speed_mps;    // Reported ground speed (m/s)
};

/**
 * Manoeuvre category of a route waypoint.
 */
enum class TurnDirection { LEFT, RIGHT, STRAIGHT, U_TURN, DESTINATION };

/**
 * Waypoint along a precomputed route.
 * Raw waypoints come from the route generator; direction and protection
 * are filled in by RoutePreprocessor.
 */
struct RouteWaypoint {
    double latitude;
    double longitude;
    std::string instruction;            // Human-readable turn instruction
    TurnDirection direction = TurnDirection::STRAIGHT;
    double distance_from_start_m = 0.0; // Distance along route from start (meters)
    bool is_protected = false;          // Exempt from passed-turn detection
};

/**
 * Logical source of a spoken announcement. Priority derives from it.
 */
enum class SpeechDomain { SYSTEM, NAVIGATION, COACH };

#endif // RUN_SESSION_TYPES_HPP_
