#ifndef RUN_SESSION_GEO_HPP_
#define RUN_SESSION_GEO_HPP_

constexpr double PI = 3.14159265358979323846;

// Mean earth radius for the spherical approximation (meters)
constexpr double EARTH_RADIUS_M = 6371000.0;

/**
 * Great-circle distance between two WGS84 coordinates using the haversine formula.
 *
 * @return Distance in meters
 */
double haversine_distance(double lat1, double lon1, double lat2, double lon2);

// Convert degrees to radians
double to_radians(double degrees);

#endif // RUN_SESSION_GEO_HPP_
