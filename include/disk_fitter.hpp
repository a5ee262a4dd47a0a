#ifndef DISK_FITTER_HPP
#define DISK_FITTER_HPP

#include "beam.hpp"
#include "disk_model.hpp"
#include "fit_types.hpp"
#include "kinematics.hpp"
#include <Eigen/Core>
#include <optional>
#include <ostream>
#include <utility>

namespace disk_fit {

/// Residuals (or chi values) of each fitted moment.
struct MomentVectors {
    Eigen::VectorXd vel;
    std::optional<Eigen::VectorXd> sig; ///< Only when the dispersion is fit.
};

/**
 * @brief Objective of a disk-model fit to a set of kinematic measurements.
 *
 * Construction binds the model to the data: it takes the evaluation grid,
 * beam and (optionally) surface-brightness weighting from the Kinematics
 * object, selects the good measurements, decides whether errors and
 * covariances can be used, and precomputes the weights that turn
 * residuals into chi values. The model and Kinematics objects must
 * outlive the fitter.
 *
 * All objective functions take the vector of free parameters only.
 */
class DiskFitter {
  public:
    /**
     * @throws std::invalid_argument If the configuration is inconsistent
     *         with the model or the data (see FitConfig).
     */
    DiskFitter(const DiskModel &model, const Kinematics &kin, const FitConfig &config);

    /// Starting values of the free parameters.
    Eigen::VectorXd free_start() const;
    Eigen::VectorXd free_lb() const;
    Eigen::VectorXd free_ub() const;
    /// Full parameter vector for a set of free parameters.
    Eigen::VectorXd full_par(const Eigen::VectorXd &free_par) const;

    Eigen::Index nfree() const { return free_.count(); }
    Eigen::Index vel_nmeas() const { return vel_indx_.size(); }
    Eigen::Index sig_nmeas() const { return fit_disp_ ? sig_indx_.size() : 0; }
    /// Length of the residual vector.
    Eigen::Index nresid() const { return vel_nmeas() + sig_nmeas(); }
    bool fits_dispersion() const { return fit_disp_; }
    bool uses_errors() const { return has_err_; }
    bool uses_covariance() const { return has_covar_; }
    double vel_scatter() const { return vel_scatter_; }
    double sig_scatter() const { return sig_scatter_; }
    double diff_step() const { return diff_step_; }
    const BoolVector &free() const { return free_; }

    /// Data minus model, per moment; the dispersion residual is in sigma^2.
    MomentVectors resid_sep(const Eigen::VectorXd &free_par) const;
    Eigen::VectorXd resid(const Eigen::VectorXd &free_par) const;
    /// Error-normalized (or covariance-whitened) residuals.
    MomentVectors chisqr_sep(const Eigen::VectorXd &free_par) const;
    Eigen::VectorXd chisqr(const Eigen::VectorXd &free_par) const;
    /// Figure of merit minimized by the fit: the sum of the squared chi values.
    double fom(const Eigen::VectorXd &free_par) const;
    /// Gaussian log-likelihood, -chi^2/2, suitable for an external sampler.
    double log_likelihood(const Eigen::VectorXd &free_par) const;

  private:
    const DiskModel &model_;
    const Kinematics &kin_;

    Eigen::VectorXd p0_;
    BoolVector free_;
    Eigen::VectorXd lb_;
    Eigen::VectorXd ub_;
    double diff_step_ = 0.01;

    std::optional<Map2D> sb_;
    bool fit_disp_ = false;
    bool has_err_ = false;
    bool has_covar_ = false;
    double vel_scatter_ = 0.0;
    double sig_scatter_ = 0.0;

    IndexVector vel_indx_;
    IndexVector sig_indx_;
    Eigen::VectorXd vel_data_;
    Eigen::VectorXd sig_data_;
    /// 1/sqrt(err^2 + scatter^2) when not using covariances.
    Eigen::VectorXd vel_wgt_;
    Eigen::VectorXd sig_wgt_;
    /// Inverse upper Cholesky factor of the covariance (whitening operator).
    Eigen::MatrixXd vel_ucov_;
    Eigen::MatrixXd sig_ucov_;

    mutable ConvolveFFT cnv_;

    ModelMaps evaluate(const Eigen::VectorXd &free_par) const;
};

/**
 * @brief Bounded nonlinear least-squares fit of a disk model.
 *
 * Minimizes the chi values of DiskFitter over the free parameters with a
 * trust-region solver using numerical derivatives, then estimates the
 * parameter errors from the Jacobian at the solution. The model is not
 * modified; use DiskModel::apply to adopt the result.
 *
 * @throws std::invalid_argument For an invalid configuration (nothing is fit).
 */
FitResult
lsq_fit(const DiskModel &model, const Kinematics &kin, const FitConfig &config = FitConfig());

/**
 * @brief Write a human-readable summary of a fit.
 * @throws std::invalid_argument If the result does not match the model layout.
 */
void
write_report(std::ostream &os, const DiskModel &model, const FitResult &result);

} // namespace disk_fit

#endif // DISK_FITTER_HPP
