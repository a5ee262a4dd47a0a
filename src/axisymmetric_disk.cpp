#include "axisymmetric_disk.hpp"
#include <utility>

namespace disk_fit {

AxisymmetricDisk::AxisymmetricDisk(std::shared_ptr<const Func1D> rc, std::shared_ptr<const Func1D> dc)
  : DiskModel({ std::move(rc) }, std::move(dc), { { "vt", "Rotation Curve" } }) {
    init_layout();
}

Eigen::VectorXd
AxisymmetricDisk::base_guess() const {
    Eigen::VectorXd p(5);
    p << 0.0, 0.0, 45.0, 30.0, 0.0;
    return p;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd>
AxisymmetricDisk::base_bounds(double minx, double maxx, double miny, double maxy) const {
    Eigen::VectorXd lb(5);
    Eigen::VectorXd ub(5);
    lb << minx, miny, -350.0, 1.0, -300.0;
    ub << maxx, maxy, 350.0, 89.0, 300.0;
    return { lb, ub };
}

std::vector<std::string>
AxisymmetricDisk::base_names(bool short_names) const {
    if (short_names) { return { "x0", "y0", "pa", "inc", "vsys" }; }
    return { "X center", "Y center", "Position Angle", "Inclination", "Systemic Velocity" };
}

Map2D
AxisymmetricDisk::los_velocity(const Eigen::VectorXd &par, const PolarCoordinates &polar) const {
    return par(4) + sample_curve(0, par, polar.r) * polar.theta.cos();
}

} // namespace disk_fit
