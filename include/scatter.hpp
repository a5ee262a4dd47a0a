#ifndef SCATTER_HPP
#define SCATTER_HPP

#include "array_types.hpp"
#include <Eigen/Core>
#include <cstddef>
#include <optional>

namespace disk_fit {

/**
 * @brief Result of an intrinsic-scatter estimate.
 */
struct ScatterResult {
    double scatter = 0.0;  ///< Scatter added in quadrature to the errors.
    BoolVector rejected;   ///< Measurements rejected by sigma clipping.
    int iterations = 0;    ///< Number of clipping iterations performed.
    bool converged = false; ///< True if the rejection set stopped changing.
};

/**
 * @brief Estimates the intrinsic scatter of model residuals.
 *
 * The scatter s is chosen such that
 *
 *     sum_i r_i^2 / (e_i^2 + s^2) = N - npar,
 *
 * i.e. the reduced chi-square of the residuals is unity once s is added
 * in quadrature to the measurement errors. If no errors are provided,
 * e_i = 0 and s is the rms of the residuals (corrected for the degrees of
 * freedom).
 */
class IntrinsicScatter {
  public:
    /**
     * @param resid Residuals (data - model).
     * @param err Measurement errors, same length as @p resid. Optional.
     * @param gpm Good-pixel mask selecting usable residuals. Optional.
     * @param npar Number of model parameters used to produce the residuals.
     * @throws std::invalid_argument On length mismatches or if no residuals are usable.
     */
    IntrinsicScatter(Eigen::ArrayXd resid,
                     std::optional<Eigen::ArrayXd> err = std::nullopt,
                     std::optional<BoolVector> gpm = std::nullopt,
                     std::size_t npar = 0);

    /// Scatter for the residuals selected by @p gpm (no clipping).
    double fit(const BoolVector &gpm) const;

    /**
     * @brief Fit the scatter with iterative sigma clipping.
     *
     * @param sigma_rej Rejection threshold for the error-normalized residuals.
     * @param maxiter Maximum number of clipping iterations.
     */
    ScatterResult iter_fit(double sigma_rej = 5.0, int maxiter = 10) const;

  private:
    Eigen::ArrayXd resid_;
    Eigen::ArrayXd err_;
    BoolVector gpm_;
    std::size_t npar_;
};

} // namespace disk_fit

#endif // SCATTER_HPP
