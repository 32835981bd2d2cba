#include "RunSessionCore/geo.hpp"
#include <cmath>

double to_radians(double degrees)
{
    return degrees * (PI / 180.0);
}

// Haversine great-circle distance on a spherical earth
double haversine_distance(double lat1, double lon1, double lat2, double lon2)
{
    double d_lat = to_radians(lat2 - lat1);
    double d_lon = to_radians(lon2 - lon1);

    double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
               std::cos(to_radians(lat1)) * std::cos(to_radians(lat2)) *
               std::sin(d_lon / 2) * std::sin(d_lon / 2);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return EARTH_RADIUS_M * c;
}
