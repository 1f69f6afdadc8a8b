#include "geo.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using lplan::Coordinate;
using lplan::distance_km;

TEST(GeoDistance, SamePointIsZero)
{
    const Coordinate p{40.7128, -74.0060};
    EXPECT_DOUBLE_EQ(distance_km(p, p), 0.0);
    EXPECT_DOUBLE_EQ(distance_km(Coordinate{0.0, 0.0}, Coordinate{0.0, 0.0}), 0.0);
}

TEST(GeoDistance, IsSymmetric)
{
    const std::vector<Coordinate> pts = {
        {40.7128, -74.0060}, {40.9, -74.9}, {-33.8688, 151.2093},
        {51.5074, -0.1278},  {0.0, 179.9},  {0.0, -179.9},
    };
    for (const auto& a : pts) {
        for (const auto& b : pts) {
            EXPECT_DOUBLE_EQ(distance_km(a, b), distance_km(b, a));
            EXPECT_GE(distance_km(a, b), 0.0);
        }
    }
}

TEST(GeoDistance, OneDegreeOfLatitude)
{
    // R * pi / 180
    EXPECT_NEAR(distance_km(Coordinate{0.0, 0.0}, Coordinate{1.0, 0.0}), 111.19493, 1e-4);
}

TEST(GeoDistance, QuarterAndHalfGreatCircle)
{
    EXPECT_NEAR(distance_km(Coordinate{0.0, 0.0}, Coordinate{0.0, 90.0}),
                lplan::EARTH_RADIUS_KM * M_PI / 2.0, 1e-6);
    EXPECT_NEAR(distance_km(Coordinate{0.0, 0.0}, Coordinate{0.0, 180.0}),
                lplan::EARTH_RADIUS_KM * M_PI, 1e-6);
}

TEST(GeoDistance, ShortUrbanHop)
{
    // ~11 m north and ~8 m west in Manhattan
    double d = distance_km(Coordinate{40.7128, -74.0060}, Coordinate{40.7129, -74.0061});
    EXPECT_NEAR(d, 0.0140, 0.0005);
}

TEST(GeoDistance, AntimeridianIsShortWay)
{
    double d = distance_km(Coordinate{0.0, 179.9}, Coordinate{0.0, -179.9});
    EXPECT_NEAR(d, 22.239, 0.01);
}
