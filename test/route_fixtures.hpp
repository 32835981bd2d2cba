/*
 * Route geometry helpers shared by the navigation tests.
 * Positions are offsets in meters from a fixed start point.
 */

#ifndef TEST_ROUTE_FIXTURES_HPP_
#define TEST_ROUTE_FIXTURES_HPP_

#include <cmath>
#include <string>
#include "RunSessionCore/geo.hpp"
#include "RunSessionCore/types.hpp"

constexpr double START_LAT = 37.7749;
constexpr double START_LON = -122.4194;
constexpr double METERS_PER_DEGREE_LAT = EARTH_RADIUS_M * PI / 180.0;

inline double lat_north(double meters) {
    return START_LAT + meters / METERS_PER_DEGREE_LAT;
}

inline double lon_east(double meters) {
    return START_LON + meters / (METERS_PER_DEGREE_LAT * std::cos(START_LAT * PI / 180.0));
}

inline RouteWaypoint waypoint_north(double meters, const std::string& instruction,
                                    double distance_from_start) {
    RouteWaypoint wp;
    wp.latitude = lat_north(meters);
    wp.longitude = START_LON;
    wp.instruction = instruction;
    wp.distance_from_start_m = distance_from_start;
    return wp;
}

#endif // TEST_ROUTE_FIXTURES_HPP_
