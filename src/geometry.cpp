#include "geometry.hpp"
#include <algorithm> // For std::max
#include <cmath>     // For trig functions
#include <limits>    // For numeric_limits
#include <numbers>   // For std::numbers::pi
#include <stdexcept> // For std::invalid_argument

namespace disk_fit {

PolarCoordinates
projected_polar(const Map2D &x, const Map2D &y, double pa, double inc) {
    if (x.rows() != y.rows() || x.cols() != y.cols()) {
        throw std::invalid_argument("Coordinate arrays passed to projected_polar must have the same shape.");
    }

    double const sinp = std::sin(pa);
    double const cosp = std::cos(pa);
    // Keep the deprojection finite at inc = 90 deg
    double const cosi = std::max(std::abs(std::cos(inc)), std::numeric_limits<double>::epsilon());

    // Rotate into the major/minor axis frame, then deproject the minor axis
    Map2D const xd = x * sinp + y * cosp;
    Map2D const yd = (y * sinp - x * cosp) / cosi;

    PolarCoordinates polar;
    polar.r = (xd.square() + yd.square()).sqrt();
    polar.theta = yd.binaryExpr(xd, [](double b, double a) {
        double const two_pi = 2 * std::numbers::pi;
        double const t = std::atan2(b, a);
        if (t >= 0) { return t; }
        // A round-off negative angle lands on 2 pi after the shift
        double const wrapped = t + two_pi;
        return wrapped >= two_pi ? 0.0 : wrapped;
    });
    return polar;
}

} // namespace disk_fit
