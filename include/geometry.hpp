#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "array_types.hpp"
#include <utility>

namespace disk_fit {

/**
 * @brief In-plane polar coordinates of a thin disk.
 */
struct PolarCoordinates {
    Map2D r;     ///< In-plane radius, same units as the input coordinates.
    Map2D theta; ///< In-plane azimuth in [0, 2pi), measured from the receding major axis.
};

/**
 * @brief Deproject on-sky Cartesian coordinates into the disk plane.
 *
 * The sky coordinates are rotated into the frame of the major and minor
 * axes and the minor-axis coordinate is stretched by 1/cos(inc).
 *
 * @param x On-sky x coordinates (increasing toward the East).
 * @param y On-sky y coordinates (increasing toward the North).
 * @param pa Position angle of the receding major axis, in radians, from N through E.
 * @param inc Inclination in radians; 0 is face-on.
 * @return PolarCoordinates In-plane radius and azimuth.
 *
 * The deprojection factor is bounded away from zero, so an edge-on disk
 * yields large (but finite) minor-axis radii instead of infinities.
 */
PolarCoordinates
projected_polar(const Map2D &x, const Map2D &y, double pa, double inc);

/// Convert degrees to radians.
constexpr double
deg_to_rad(double deg) {
    return deg * 0.017453292519943295;
}

} // namespace disk_fit

#endif // GEOMETRY_HPP
