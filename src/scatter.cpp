#include "scatter.hpp"
#include <boost/math/tools/roots.hpp> // For toms748_solve
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits> // For numeric_limits<double>::infinity
#include <stdexcept>
#include <utility>

namespace disk_fit {

IntrinsicScatter::IntrinsicScatter(Eigen::ArrayXd resid,
                                   std::optional<Eigen::ArrayXd> err,
                                   std::optional<BoolVector> gpm,
                                   std::size_t npar)
  : resid_(std::move(resid))
  , npar_(npar) {
    Eigen::Index const n = resid_.size();
    if (err.has_value() && err->size() != n) {
        throw std::invalid_argument("Error vector must have the same length as the residuals.");
    }
    if (gpm.has_value() && gpm->size() != n) {
        throw std::invalid_argument("Good-pixel mask must have the same length as the residuals.");
    }
    err_ = err.has_value() ? *err : Eigen::ArrayXd(Eigen::ArrayXd::Zero(n));
    gpm_ = gpm.has_value() ? *gpm : BoolVector(BoolVector::Constant(n, true));
    gpm_ = gpm_ && resid_.isFinite() && err_.isFinite();
    if (static_cast<std::size_t>(gpm_.count()) <= npar_) {
        throw std::invalid_argument("Too few usable residuals to estimate the intrinsic scatter.");
    }
}

double
IntrinsicScatter::fit(const BoolVector &gpm) const {
    double const dof = static_cast<double>(gpm.count()) - static_cast<double>(npar_);
    if (dof <= 0) { throw std::invalid_argument("No degrees of freedom left to estimate the scatter."); }

    auto chisqr_excess = [&](double s) {
        double chisqr = 0.0;
        for (Eigen::Index i = 0; i < resid_.size(); ++i) {
            if (!gpm(i)) { continue; }
            double const var = err_(i) * err_(i) + s * s;
            if (var > 0.0) {
                chisqr += resid_(i) * resid_(i) / var;
            } else if (resid_(i) != 0.0) {
                // Nonzero residual with no error and no scatter
                return std::numeric_limits<double>::infinity();
            }
        }
        return chisqr - dof;
    };

    // Without errors the equation has a closed-form solution
    if (((err_ == 0.0) || !gpm).all()) {
        double const ss = gpm.select(resid_.square(), 0.0).sum();
        return std::sqrt(ss / dof);
    }

    // Errors alone already account for the residuals
    if (chisqr_excess(0.0) <= 0.0) { return 0.0; }

    double upper = std::sqrt(gpm.select(resid_.square(), 0.0).maxCoeff()) + 1.0;
    while (chisqr_excess(upper) > 0.0) { upper *= 2.0; }

    // Zero errors make the excess diverge at s = 0, so bracket from a small positive scatter
    double lower = 0.0;
    if (!std::isfinite(chisqr_excess(0.0))) {
        lower = upper;
        do { lower *= 0.5; } while (chisqr_excess(lower) <= 0.0);
    }

    boost::math::tools::eps_tolerance<double> const tol(40);
    std::uintmax_t max_iter = 200;
    auto const bracket = boost::math::tools::toms748_solve(chisqr_excess, lower, upper, tol, max_iter);
    return 0.5 * (bracket.first + bracket.second);
}

ScatterResult
IntrinsicScatter::iter_fit(double sigma_rej, int maxiter) const {
    ScatterResult result;
    BoolVector gpm = gpm_;
    for (int iter = 0; iter < maxiter; ++iter) {
        result.iterations = iter + 1;
        result.scatter = fit(gpm);
        Eigen::ArrayXd const var = err_.square() + result.scatter * result.scatter;
        Eigen::ArrayXd const z = (var > 0.0).select(resid_ / var.sqrt(), 0.0);
        BoolVector const keep = gpm_ && (z.abs() <= sigma_rej);
        if (static_cast<std::size_t>(keep.count()) <= npar_) {
            std::cerr << "[IntrinsicScatter] Warning: Clipping would reject too many measurements; stopping."
                      << std::endl;
            break;
        }
        if ((keep == gpm).all()) {
            result.converged = true;
            break;
        }
        gpm = keep;
    }
    result.rejected = gpm_ && !gpm;
    return result;
}

} // namespace disk_fit
