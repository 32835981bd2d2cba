/*
 * Unit tests for geo helpers
 * Tests: Haversine, Radians
 */

#include <gtest/gtest.h>
#include <cmath>
#include "RunSessionCore/geo.hpp"

constexpr double TOL = 1e-6;
constexpr double METERS_PER_DEGREE = EARTH_RADIUS_M * PI / 180.0;

// ============================================================================
// Test Suite: Geo_Haversine
// ============================================================================

TEST(Geo_Haversine, SamePointIsZero) {
    EXPECT_NEAR(haversine_distance(37.7749, -122.4194, 37.7749, -122.4194), 0.0, TOL);
}

TEST(Geo_Haversine, OneDegreeOfLatitude) {
    double d = haversine_distance(0.0, 0.0, 1.0, 0.0);
    EXPECT_NEAR(d, METERS_PER_DEGREE, 1e-3);
    EXPECT_NEAR(d, 111194.93, 0.01);
}

TEST(Geo_Haversine, IsSymmetric) {
    double ab = haversine_distance(51.5007, -0.1246, 40.6892, -74.0445);
    double ba = haversine_distance(40.6892, -74.0445, 51.5007, -0.1246);
    EXPECT_NEAR(ab, ba, TOL);
}

TEST(Geo_Haversine, LongitudeShrinksWithLatitude) {
    double at_equator = haversine_distance(0.0, 0.0, 0.0, 0.001);
    double at_sixty = haversine_distance(60.0, 0.0, 60.0, 0.001);
    EXPECT_NEAR(at_sixty / at_equator, 0.5, 1e-4);
}

TEST(Geo_Haversine, ShortRunningDistance) {
    // 200 m due north
    double lat2 = 37.7749 + 200.0 / METERS_PER_DEGREE;
    EXPECT_NEAR(haversine_distance(37.7749, -122.4194, lat2, -122.4194), 200.0, 1e-6);
}

TEST(Geo_Haversine, AntipodalPoints) {
    EXPECT_NEAR(haversine_distance(0.0, 0.0, 0.0, 180.0), PI * EARTH_RADIUS_M, 1e-3);
}

// ============================================================================
// Test Suite: Geo_Radians
// ============================================================================

TEST(Geo_Radians, Conversion) {
    EXPECT_NEAR(to_radians(0.0), 0.0, TOL);
    EXPECT_NEAR(to_radians(180.0), PI, TOL);
    EXPECT_NEAR(to_radians(-90.0), -PI / 2.0, TOL);
}

TEST(Geo_Radians, PiMatchesLibraryValue) {
    EXPECT_DOUBLE_EQ(PI, std::acos(-1.0));
    EXPECT_NEAR(to_radians(90.0), std::acos(0.0), TOL);
}
