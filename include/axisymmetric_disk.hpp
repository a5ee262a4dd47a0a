#ifndef AXISYMMETRIC_DISK_HPP
#define AXISYMMETRIC_DISK_HPP

#include "disk_model.hpp"
#include <memory>

namespace disk_fit {

/**
 * @brief Thin disk in pure circular rotation.
 *
 * Base parameters: x0, y0, pa, inc, vsys. The line-of-sight velocity is
 * vsys + V(r) cos(theta), where V is the projected rotation curve.
 */
class AxisymmetricDisk : public DiskModel {
  public:
    explicit AxisymmetricDisk(std::shared_ptr<const Func1D> rc = std::make_shared<HyperbolicTangent>(),
                              std::shared_ptr<const Func1D> dc = nullptr);

    Eigen::Index nbp() const override { return 5; }
    double default_diff_step() const override { return 0.01; }

    /// Rotation-curve parameters (or errors).
    Eigen::VectorXd rc_par(bool err = false) const { return velocity_par(0, err); }
    const Func1D &rc() const { return velocity_curve(0); }

  protected:
    Eigen::VectorXd base_guess() const override;
    std::pair<Eigen::VectorXd, Eigen::VectorXd>
    base_bounds(double minx, double maxx, double miny, double maxy) const override;
    std::vector<std::string> base_names(bool short_names) const override;
    Map2D los_velocity(const Eigen::VectorXd &par, const PolarCoordinates &polar) const override;
};

} // namespace disk_fit

#endif // AXISYMMETRIC_DISK_HPP
