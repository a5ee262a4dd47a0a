#ifndef BISYMMETRIC_DISK_HPP
#define BISYMMETRIC_DISK_HPP

#include "disk_model.hpp"
#include <memory>

namespace disk_fit {

/**
 * @brief Thin disk with circular rotation plus a second-order (bar-like) flow.
 *
 * Base parameters: x0, y0, pa, inc, pab, vsys, where pab is the in-plane
 * angle of the bisymmetric distortion relative to the major axis. The
 * velocity curves are the projected tangential rotation (vt) and the
 * tangential (v2t) and radial (v2r) amplitudes of the second-order flow
 * (Spekkens & Sellwood 2007).
 */
class BisymmetricDisk : public DiskModel {
  public:
    explicit BisymmetricDisk(std::shared_ptr<const Func1D> vt = std::make_shared<HyperbolicTangent>(),
                             std::shared_ptr<const Func1D> v2t = std::make_shared<PowerExp>(),
                             std::shared_ptr<const Func1D> v2r = std::make_shared<PowerExp>(),
                             std::shared_ptr<const Func1D> dc = nullptr);

    Eigen::Index nbp() const override { return 6; }
    double default_diff_step() const override { return 0.01; }

    Eigen::VectorXd vt_par(bool err = false) const { return velocity_par(0, err); }
    Eigen::VectorXd v2t_par(bool err = false) const { return velocity_par(1, err); }
    Eigen::VectorXd v2r_par(bool err = false) const { return velocity_par(2, err); }

    /// Wrap an angle in degrees into [-90, 90).
    static double wrap_pab(double pab);

  protected:
    Eigen::VectorXd base_guess() const override;
    std::pair<Eigen::VectorXd, Eigen::VectorXd>
    base_bounds(double minx, double maxx, double miny, double maxy) const override;
    std::vector<std::string> base_names(bool short_names) const override;
    Map2D los_velocity(const Eigen::VectorXd &par, const PolarCoordinates &polar) const override;
};

} // namespace disk_fit

#endif // BISYMMETRIC_DISK_HPP
