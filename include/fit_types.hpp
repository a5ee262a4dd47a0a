#ifndef FIT_TYPES_HPP
#define FIT_TYPES_HPP

#include "array_types.hpp"
#include <Eigen/Core>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace disk_fit {

/**
 * @brief Options of a single least-squares fit.
 *
 * All parameter-length vectors (p0, fix, lb, ub) span the full parameter
 * vector of the model being fit, not just the free parameters.
 */
struct FitConfig {
    bool sb_wgt = false;                ///< Weight the beam smearing by the observed surface brightness.
    std::optional<Eigen::VectorXd> p0;  ///< Starting point; defaults to the model guess.
    std::optional<BoolVector> fix;      ///< Parameters held at their p0 value.
    std::optional<Eigen::VectorXd> lb;  ///< Lower bounds; defaults to DiskModel::par_bounds.
    std::optional<Eigen::VectorXd> ub;  ///< Upper bounds; defaults to DiskModel::par_bounds.
    /// Intrinsic scatter added in quadrature to the errors: nothing, one
    /// value for all moments, or one value per fitted moment (vel, sig).
    std::vector<double> scatter;
    bool assume_posdef_covar = false;   ///< Skip the positive-definite check of the covariances.
    bool ignore_covar = true;           ///< Use only the diagonal errors even if covariances exist.
    std::optional<double> diff_step;    ///< Relative finite-difference step; model default if unset.
    int max_iterations = 200;
    double function_tolerance = 1e-8;
    double gradient_tolerance = 1e-8;
    double parameter_tolerance = 1e-8;
    bool verbose = false;
};

/**
 * @brief Outcome of DiskModel fitting.
 */
struct FitResult {
    Eigen::VectorXd par;                    ///< Best-fit parameters (full vector).
    BoolVector free;                        ///< Parameters that were optimized.
    std::optional<Eigen::VectorXd> par_err; ///< Standard errors; fixed parameters have 0. Empty if not computable.
    double vel_scatter = 0.0;
    double sig_scatter = 0.0;
    Eigen::Index vel_nmeas = 0; ///< Number of velocity measurements in the fit.
    Eigen::Index sig_nmeas = 0; ///< Number of dispersion measurements in the fit (0 if not fit).
    double vel_chisqr = 0.0;
    double sig_chisqr = 0.0;
    bool converged = false;
    int iterations = 0;
    std::string message;

    Eigen::Index nfree() const { return free.count(); }
    double chisqr() const { return vel_chisqr + sig_chisqr; }
    /// Chi-square per degree of freedom over all fitted measurements.
    double reduced_chisqr() const;
};

void
to_json(nlohmann::json &j, const FitConfig &config);
void
from_json(const nlohmann::json &j, FitConfig &config);
void
to_json(nlohmann::json &j, const FitResult &result);
void
from_json(const nlohmann::json &j, FitResult &result);

/// Parse a fit configuration; unspecified keys keep their defaults.
FitConfig
fit_config_from_json(const nlohmann::json &j);

} // namespace disk_fit

#endif // FIT_TYPES_HPP
