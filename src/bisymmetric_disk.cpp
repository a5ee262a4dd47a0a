#include "bisymmetric_disk.hpp"
#include <cmath>
#include <utility>

namespace disk_fit {

BisymmetricDisk::BisymmetricDisk(std::shared_ptr<const Func1D> vt,
                                 std::shared_ptr<const Func1D> v2t,
                                 std::shared_ptr<const Func1D> v2r,
                                 std::shared_ptr<const Func1D> dc)
  : DiskModel({ std::move(vt), std::move(v2t), std::move(v2r) },
              std::move(dc),
              { { "vt", "Tangential Velocity" },
                { "v2t", "Second-order Tangential Velocity" },
                { "v2r", "Second-order Radial Velocity" } }) {
    init_layout();
}

double
BisymmetricDisk::wrap_pab(double pab) {
    double wrapped = std::fmod(pab + 90.0, 180.0);
    if (wrapped < 0) { wrapped += 180.0; }
    return wrapped - 90.0;
}

Eigen::VectorXd
BisymmetricDisk::base_guess() const {
    Eigen::VectorXd p(6);
    p << 0.0, 0.0, 45.0, 30.0, 0.0, 0.0;
    return p;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd>
BisymmetricDisk::base_bounds(double minx, double maxx, double miny, double maxy) const {
    Eigen::VectorXd lb(6);
    Eigen::VectorXd ub(6);
    lb << minx, miny, -350.0, 1.0, -100.0, -300.0;
    ub << maxx, maxy, 350.0, 89.0, 100.0, 300.0;
    return { lb, ub };
}

std::vector<std::string>
BisymmetricDisk::base_names(bool short_names) const {
    if (short_names) { return { "x0", "y0", "pa", "inc", "pab", "vsys" }; }
    return { "X center", "Y center", "Position Angle", "Inclination", "Bisymmetry Angle", "Systemic Velocity" };
}

Map2D
BisymmetricDisk::los_velocity(const Eigen::VectorXd &par, const PolarCoordinates &polar) const {
    double const inc = deg_to_rad(par(3));
    double const pab = deg_to_rad(wrap_pab(par(4)));
    // Azimuth relative to the bisymmetric axis, projected into the disk plane
    Map2D const theta_b = polar.theta - std::atan(std::tan(pab) / std::cos(inc));

    Map2D const vt = sample_curve(0, par, polar.r);
    Map2D const v2t = sample_curve(1, par, polar.r);
    Map2D const v2r = sample_curve(2, par, polar.r);

    Map2D const cos_th = polar.theta.cos();
    return par(5) + vt * cos_th - v2t * cos_th * (2.0 * theta_b).cos() -
           v2r * polar.theta.sin() * (2.0 * theta_b).sin();
}

} // namespace disk_fit
