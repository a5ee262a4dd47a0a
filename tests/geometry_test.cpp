#include "geometry.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

using namespace disk_fit;

TEST(GeometryTest, FaceOnIsPlainPolar) {
    Map2D x(1, 4);
    Map2D y(1, 4);
    x << 1.0, 0.0, -1.0, 0.0;
    y << 0.0, 1.0, 0.0, -1.0;
    // pa = 90 deg puts the receding major axis along +x
    PolarCoordinates const polar = projected_polar(x, y, std::numbers::pi / 2, 0.0);
    EXPECT_ARRAY_NEAR(polar.r, Map2D::Ones(1, 4), 1e-12, "r");
    EXPECT_NEAR(polar.theta(0, 0), 0.0, 1e-12);
    EXPECT_NEAR(polar.theta(0, 1), std::numbers::pi / 2, 1e-12);
    EXPECT_NEAR(polar.theta(0, 2), std::numbers::pi, 1e-12);
    EXPECT_NEAR(polar.theta(0, 3), 3 * std::numbers::pi / 2, 1e-12);
}

TEST(GeometryTest, MinorAxisIsStretchedByInclination) {
    Map2D x(1, 2);
    Map2D y(1, 2);
    x << 2.0, 0.0;
    y << 0.0, 1.0;
    double const inc = deg_to_rad(60.0);
    PolarCoordinates const polar = projected_polar(x, y, std::numbers::pi / 2, inc);
    // Major-axis point is unchanged
    EXPECT_NEAR(polar.r(0, 0), 2.0, 1e-12);
    // Minor-axis point is deprojected by 1/cos(60) = 2
    EXPECT_NEAR(polar.r(0, 1), 2.0, 1e-12);
}

TEST(GeometryTest, AzimuthIsWrappedToPositiveRange) {
    Map2D const x = random_map(8, -5.0, 5.0, 1);
    Map2D const y = random_map(8, -5.0, 5.0, 2);
    PolarCoordinates const polar = projected_polar(x, y, deg_to_rad(30.0), deg_to_rad(50.0));
    EXPECT_TRUE((polar.theta >= 0.0).all());
    EXPECT_TRUE((polar.theta < 2 * std::numbers::pi).all());
    EXPECT_TRUE((polar.r >= 0.0).all());
}

TEST(GeometryTest, RoundOffOnRecedingAxisWrapsToZero) {
    // A tiny negative minor-axis offset must not yield theta = 2 pi
    Map2D x(1, 3);
    Map2D y(1, 3);
    x << 0.0, 0.0, 5.0;
    y << -1e-17, 1.0, -1e-300;
    for (double const pa : {0.0, std::numbers::pi / 2, deg_to_rad(37.0)}) {
        PolarCoordinates const polar = projected_polar(x, y, pa, deg_to_rad(20.0));
        EXPECT_TRUE((polar.theta >= 0.0).all());
        EXPECT_TRUE((polar.theta < 2 * std::numbers::pi).all()) << "pa = " << pa;
    }
    PolarCoordinates const polar = projected_polar(Map2D::Constant(1, 1, 3.0), Map2D::Constant(1, 1, 0.0),
                                                   std::numbers::pi / 2, 0.0);
    EXPECT_EQ(polar.theta(0, 0), 0.0);
}

TEST(GeometryTest, EdgeOnStaysFinite) {
    Map2D const x = random_map(6, -3.0, 3.0, 3);
    Map2D const y = random_map(6, -3.0, 3.0, 4);
    PolarCoordinates const polar = projected_polar(x, y, 0.3, std::numbers::pi / 2);
    EXPECT_TRUE(polar.r.allFinite());
    EXPECT_TRUE(polar.theta.allFinite());
}

TEST(GeometryTest, RejectsMismatchedShapes) {
    EXPECT_THROW(projected_polar(Map2D::Zero(3, 3), Map2D::Zero(3, 4), 0.0, 0.0), std::invalid_argument);
}

TEST(GeometryTest, DegreesToRadians) {
    EXPECT_NEAR(deg_to_rad(180.0), std::numbers::pi, 1e-15);
    static_assert(deg_to_rad(0.0) == 0.0);
}
