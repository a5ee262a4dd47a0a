#include "disk_fitter.hpp"
#include "covariance.hpp"
#include <ceres/ceres.h> // For the bounded least-squares solver
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>   // For the report table
#include <iostream>  // For warnings and verbose progress
#include <stdexcept>
#include <string>
#include <vector>

namespace disk_fit {

namespace {

IndexVector
good_indices(const BoolVector &mask) {
    IndexVector indx((!mask).count());
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < mask.size(); ++i) {
        if (!mask(i)) { indx(k++) = i; }
    }
    return indx;
}

Eigen::VectorXd
take(const Eigen::ArrayXd &values, const IndexVector &indx) {
    Eigen::VectorXd out(indx.size());
    for (Eigen::Index k = 0; k < indx.size(); ++k) { out(k) = values(indx(k)); }
    return out;
}

Eigen::MatrixXd
take(const Eigen::MatrixXd &covar, const IndexVector &indx) {
    Eigen::MatrixXd out(indx.size(), indx.size());
    for (Eigen::Index i = 0; i < indx.size(); ++i) {
        for (Eigen::Index j = 0; j < indx.size(); ++j) { out(i, j) = covar(indx(i), indx(j)); }
    }
    return out;
}

Eigen::VectorXd
select(const Eigen::VectorXd &full, const BoolVector &free) {
    Eigen::VectorXd out(free.count());
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < full.size(); ++i) {
        if (free(i)) { out(k++) = full(i); }
    }
    return out;
}

// Weights 1/sqrt(err^2 + scatter^2); unit weights if neither is available
Eigen::VectorXd
chi_weights(const std::optional<Eigen::ArrayXd> &ivar, const IndexVector &indx, double scatter) {
    Eigen::ArrayXd var = Eigen::ArrayXd::Constant(indx.size(), scatter * scatter);
    if (ivar.has_value()) { var += inverse(take(*ivar, indx).array()); }
    return (var > 0.0).select(var.rsqrt(), 1.0).matrix();
}

// Whitening operator for a covariance matrix, optionally inflated by the intrinsic scatter
Eigen::MatrixXd
whitening(const Eigen::MatrixXd &covar, const IndexVector &indx, double scatter, bool assume_posdef, const char *moment) {
    Eigen::MatrixXd c = take(covar, indx);
    c.diagonal().array() += scatter * scatter;
    if (!assume_posdef && !is_positive_definite(c)) {
        std::cerr << "[DiskFitter] Warning: " << moment
                  << " covariance matrix is not positive definite; using the nearest positive-definite matrix."
                  << std::endl;
        c = impose_positive_definite(c);
    }
    return cinv(c, true).transpose();
}

// Ceres cost function wrapper around the chi values of a DiskFitter
struct DiskCeresCostFunctor {
    const DiskFitter &fitter;

    explicit DiskCeresCostFunctor(const DiskFitter &f)
      : fitter(f) {}

    bool operator()(double const *const *parameters, double *residuals) const {
        Eigen::Map<const Eigen::VectorXd> const free_par(parameters[0], fitter.nfree());
        try {
            Eigen::VectorXd const chi = fitter.chisqr(free_par);
            std::copy(chi.data(), chi.data() + chi.size(), residuals);
            return chi.allFinite();
        } catch (const std::exception &e) {
            std::cerr << "[DiskFitter] Model evaluation failed: " << e.what() << std::endl;
            return false;
        }
    }
};

Eigen::MatrixXd
to_dense(const ceres::CRSMatrix &crs) {
    Eigen::MatrixXd dense = Eigen::MatrixXd::Zero(crs.num_rows, crs.num_cols);
    for (int row = 0; row < crs.num_rows; ++row) {
        for (int k = crs.rows[static_cast<std::size_t>(row)]; k < crs.rows[static_cast<std::size_t>(row) + 1]; ++k) {
            dense(row, crs.cols[static_cast<std::size_t>(k)]) = crs.values[static_cast<std::size_t>(k)];
        }
    }
    return dense;
}

} // namespace

DiskFitter::DiskFitter(const DiskModel &model, const Kinematics &kin, const FitConfig &config)
  : model_(model)
  , kin_(kin) {
    Eigen::Index const np = model_.np();

    // Starting point and free parameters
    p0_ = config.p0.has_value() ? *config.p0 : model_.guess_par();
    if (p0_.size() != np) {
        throw std::invalid_argument("Initial guess has " + std::to_string(p0_.size()) + " parameters; model has " +
                                    std::to_string(np) + ".");
    }
    if (config.fix.has_value()) {
        if (config.fix->size() != np) {
            throw std::invalid_argument("Fixed-parameter flags must have one entry per model parameter (" +
                                        std::to_string(np) + ").");
        }
        free_ = !*config.fix;
    } else {
        free_ = BoolVector::Constant(np, true);
    }
    if (free_.count() == 0) { throw std::invalid_argument("All model parameters are fixed; nothing to fit."); }

    // Bounds, with the center defaulting to the extent of the data grid
    if (config.lb.has_value() && config.lb->size() != np) {
        throw std::invalid_argument("Lower bounds must have one entry per model parameter.");
    }
    if (config.ub.has_value() && config.ub->size() != np) {
        throw std::invalid_argument("Upper bounds must have one entry per model parameter.");
    }
    if (!config.lb.has_value() || !config.ub.has_value()) {
        auto const bounds = model_.par_bounds_for_grid(kin_.grid_x(), kin_.grid_y());
        lb_ = bounds.first;
        ub_ = bounds.second;
    }
    if (config.lb.has_value()) { lb_ = *config.lb; }
    if (config.ub.has_value()) { ub_ = *config.ub; }
    for (Eigen::Index i = 0; i < np; ++i) {
        if (!free_(i)) { continue; }
        if (!(lb_(i) < ub_(i))) {
            throw std::invalid_argument("Lower bound must be below the upper bound for parameter " +
                                        std::to_string(i) + ".");
        }
        if (p0_(i) < lb_(i) || p0_(i) > ub_(i)) {
            throw std::invalid_argument("Initial guess for parameter " + std::to_string(i) + " (" +
                                        std::to_string(p0_(i)) + ") is outside its bounds [" +
                                        std::to_string(lb_(i)) + ", " + std::to_string(ub_(i)) + "].");
        }
    }

    diff_step_ = config.diff_step.has_value() ? *config.diff_step : model_.default_diff_step();
    if (!(diff_step_ > 0)) { throw std::invalid_argument("Finite-difference step must be positive."); }

    if (config.sb_wgt) {
        std::optional<MaskedMap> const sb = kin_.remap("sb");
        if (!sb.has_value()) {
            throw std::invalid_argument("Cannot weight by surface brightness; no surface brightness data.");
        }
        sb_ = sb->filled(0.0);
    }

    fit_disp_ = model_.has_dispersion();
    if (fit_disp_ && !kin_.sig_phys2().has_value()) {
        throw std::invalid_argument("Model includes a dispersion curve, but no dispersion data were provided.");
    }

    // Intrinsic scatter: at most one value per fitted moment
    std::size_t const nmoments = fit_disp_ ? 2 : 1;
    if (config.scatter.size() > nmoments) {
        throw std::invalid_argument("Provide at most one intrinsic scatter value per fitted moment (" +
                                    std::to_string(nmoments) + "); found " + std::to_string(config.scatter.size()) +
                                    ".");
    }
    if (std::any_of(config.scatter.begin(), config.scatter.end(), [](double s) { return s < 0; })) {
        throw std::invalid_argument("Intrinsic scatter cannot be negative.");
    }
    if (config.scatter.size() == 1) {
        vel_scatter_ = config.scatter.front();
        if (fit_disp_) {
            std::cerr << "[DiskFitter] Warning: Single intrinsic scatter value applied to both the velocity and "
                         "dispersion measurements."
                      << std::endl;
            sig_scatter_ = vel_scatter_;
        }
    } else if (config.scatter.size() == 2) {
        vel_scatter_ = config.scatter[0];
        sig_scatter_ = config.scatter[1];
    }

    // Usable measurements; the data vectors are fixed for the lifetime of the fitter
    vel_indx_ = good_indices(kin_.vel_mask());
    vel_data_ = take(kin_.vel(), vel_indx_);
    if (fit_disp_) {
        sig_indx_ = kin_.sig_mask().has_value() ? good_indices(*kin_.sig_mask())
                                                : IndexVector::LinSpaced(kin_.nmeas(), 0, kin_.nmeas() - 1);
        sig_data_ = take(*kin_.sig_phys2(), sig_indx_);
    }
    if (vel_indx_.size() + (fit_disp_ ? sig_indx_.size() : 0) < nfree()) {
        throw std::invalid_argument("Fewer unmasked measurements than free parameters.");
    }

    // Errors and covariances must be available for every fitted moment
    has_err_ = kin_.vel_ivar().has_value();
    has_covar_ = !config.ignore_covar && kin_.vel_covar().has_value();
    if (fit_disp_) {
        bool const sig_err = kin_.sig_phys2_ivar().has_value();
        if (has_err_ != sig_err) {
            std::cerr << "[DiskFitter] Warning: Errors are available for only one of the velocity and dispersion "
                         "measurements; ignoring all errors."
                      << std::endl;
            has_err_ = false;
        }
        bool const sig_covar = !config.ignore_covar && kin_.sig_phys2_covar().has_value();
        if (has_covar_ != sig_covar) {
            std::cerr << "[DiskFitter] Warning: Covariance is available for only one of the velocity and dispersion "
                         "measurements; ignoring all covariance."
                      << std::endl;
            has_covar_ = false;
        }
    }

    if (has_covar_) {
        vel_ucov_ = whitening(*kin_.vel_covar(), vel_indx_, vel_scatter_, config.assume_posdef_covar, "Velocity");
        if (fit_disp_) {
            sig_ucov_ = whitening(
              *kin_.sig_phys2_covar(), sig_indx_, sig_scatter_, config.assume_posdef_covar, "Dispersion");
        }
    } else {
        std::optional<Eigen::ArrayXd> const none;
        vel_wgt_ = chi_weights(has_err_ ? kin_.vel_ivar() : none, vel_indx_, vel_scatter_);
        if (fit_disp_) { sig_wgt_ = chi_weights(has_err_ ? kin_.sig_phys2_ivar() : none, sig_indx_, sig_scatter_); }
    }
}

Eigen::VectorXd
DiskFitter::free_start() const {
    return select(p0_, free_);
}

Eigen::VectorXd
DiskFitter::free_lb() const {
    return select(lb_, free_);
}

Eigen::VectorXd
DiskFitter::free_ub() const {
    return select(ub_, free_);
}

Eigen::VectorXd
DiskFitter::full_par(const Eigen::VectorXd &free_par) const {
    if (free_par.size() != nfree()) {
        throw std::invalid_argument("Expected " + std::to_string(nfree()) + " free parameters; found " +
                                    std::to_string(free_par.size()) + ".");
    }
    Eigen::VectorXd full = p0_;
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < full.size(); ++i) {
        if (free_(i)) { full(i) = free_par(k++); }
    }
    return full;
}

ModelMaps
DiskFitter::evaluate(const Eigen::VectorXd &free_par) const {
    const auto &beam_fft = kin_.beam_fft();
    return model_.evaluate(full_par(free_par),
                           kin_.grid_x(),
                           kin_.grid_y(),
                           beam_fft.has_value() ? &*beam_fft : nullptr,
                           sb_.has_value() ? &*sb_ : nullptr,
                           &cnv_);
}

MomentVectors
DiskFitter::resid_sep(const Eigen::VectorXd &free_par) const {
    ModelMaps const maps = evaluate(free_par);
    MomentVectors out;
    out.vel = vel_data_ - take(kin_.bin(maps.vel), vel_indx_);
    if (fit_disp_) { out.sig = sig_data_ - take(Eigen::ArrayXd(kin_.bin(*maps.sig).square()), sig_indx_); }
    return out;
}

Eigen::VectorXd
DiskFitter::resid(const Eigen::VectorXd &free_par) const {
    MomentVectors const r = resid_sep(free_par);
    if (!r.sig.has_value()) { return r.vel; }
    Eigen::VectorXd out(r.vel.size() + r.sig->size());
    out << r.vel, *r.sig;
    return out;
}

MomentVectors
DiskFitter::chisqr_sep(const Eigen::VectorXd &free_par) const {
    MomentVectors out = resid_sep(free_par);
    if (has_covar_) {
        out.vel = vel_ucov_ * out.vel;
        if (out.sig.has_value()) { *out.sig = sig_ucov_ * *out.sig; }
        return out;
    }
    out.vel = out.vel.cwiseProduct(vel_wgt_);
    if (out.sig.has_value()) { *out.sig = out.sig->cwiseProduct(sig_wgt_); }
    return out;
}

Eigen::VectorXd
DiskFitter::chisqr(const Eigen::VectorXd &free_par) const {
    MomentVectors const chi = chisqr_sep(free_par);
    if (!chi.sig.has_value()) { return chi.vel; }
    Eigen::VectorXd out(chi.vel.size() + chi.sig->size());
    out << chi.vel, *chi.sig;
    return out;
}

double
DiskFitter::fom(const Eigen::VectorXd &free_par) const {
    return chisqr(free_par).squaredNorm();
}

double
DiskFitter::log_likelihood(const Eigen::VectorXd &free_par) const {
    return -0.5 * fom(free_par);
}

FitResult
lsq_fit(const DiskModel &model, const Kinematics &kin, const FitConfig &config) {
    DiskFitter const fitter(model, kin, config);

    Eigen::VectorXd const start = fitter.free_start();
    Eigen::VectorXd const lower = fitter.free_lb();
    Eigen::VectorXd const upper = fitter.free_ub();
    std::vector<double> params(start.data(), start.data() + start.size());

    // Central differences with a step relative to each parameter value
    ceres::NumericDiffOptions diff_options;
    diff_options.relative_step_size = fitter.diff_step();

    auto *cost_function = new ceres::DynamicNumericDiffCostFunction<DiskCeresCostFunctor, ceres::CENTRAL>(
      new DiskCeresCostFunctor(fitter), ceres::TAKE_OWNERSHIP, diff_options);
    cost_function->AddParameterBlock(static_cast<int>(params.size()));
    cost_function->SetNumResiduals(static_cast<int>(fitter.nresid()));

    ceres::Problem problem;
    problem.AddResidualBlock(cost_function, nullptr, params.data()); // Plain least squares, no loss function
    for (Eigen::Index i = 0; i < start.size(); ++i) {
        problem.SetParameterLowerBound(params.data(), static_cast<int>(i), lower(i));
        problem.SetParameterUpperBound(params.data(), static_cast<int>(i), upper(i));
    }

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.trust_region_strategy_type = ceres::LEVENBERG_MARQUARDT;
    options.max_num_iterations = config.max_iterations;
    options.function_tolerance = config.function_tolerance;
    options.gradient_tolerance = config.gradient_tolerance;
    options.parameter_tolerance = config.parameter_tolerance;
    options.minimizer_progress_to_stdout = config.verbose;

    if (config.verbose) {
        std::cout << "[DiskFitter] Fitting " << fitter.nfree() << " free parameters to " << fitter.nresid()
                  << " measurements." << std::endl;
    }
    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);
    if (config.verbose) { std::cout << summary.BriefReport() << "\n"; }

    Eigen::Map<const Eigen::VectorXd> const best(params.data(), static_cast<Eigen::Index>(params.size()));

    // Restore the full parameter vector and collect the fit statistics
    FitResult result;
    result.par = fitter.full_par(best);
    result.free = fitter.free();
    result.vel_scatter = fitter.vel_scatter();
    result.sig_scatter = fitter.sig_scatter();
    result.vel_nmeas = fitter.vel_nmeas();
    result.sig_nmeas = fitter.sig_nmeas();
    result.converged = summary.IsSolutionUsable();
    result.iterations = static_cast<int>(summary.iterations.size());
    result.message = summary.message;

    MomentVectors const chi = fitter.chisqr_sep(best);
    result.vel_chisqr = chi.vel.squaredNorm();
    result.sig_chisqr = chi.sig.has_value() ? chi.sig->squaredNorm() : 0.0;

    if (!result.converged) {
        std::cerr << "[DiskFitter] Warning: Fit did not converge: " << summary.message << std::endl;
    }

    // Parameter errors from the Jacobian at the best-fit parameters
    ceres::CRSMatrix jacobian;
    if (!problem.Evaluate(ceres::Problem::EvaluateOptions(), nullptr, nullptr, nullptr, &jacobian)) {
        std::cerr << "[DiskFitter] Warning: Could not evaluate the Jacobian; parameter errors are unavailable."
                  << std::endl;
        return result;
    }
    try {
        Eigen::MatrixXd const covar = cov_err(to_dense(jacobian));
        Eigen::VectorXd err = Eigen::VectorXd::Zero(model.np());
        Eigen::Index k = 0;
        for (Eigen::Index i = 0; i < err.size(); ++i) {
            if (result.free(i)) {
                err(i) = std::sqrt(covar(k, k));
                ++k;
            }
        }
        result.par_err = err;
    } catch (const std::runtime_error &e) {
        std::cerr << "[DiskFitter] Warning: Unable to compute parameter errors: " << e.what() << std::endl;
    }
    return result;
}

void
write_report(std::ostream &os, const DiskModel &model, const FitResult &result) {
    if (result.par.size() != model.np()) {
        throw std::invalid_argument("Fit result has " + std::to_string(result.par.size()) +
                                    " parameters; model has " + std::to_string(model.np()) + ".");
    }
    std::vector<std::string> const names = model.par_names();
    std::size_t width = 9;
    for (const auto &name : names) { width = std::max(width, name.size()); }

    std::ios_base::fmtflags const flags = os.flags();
    os << "Fit " << (result.converged ? "converged" : "did not converge") << " after " << result.iterations
       << " iterations: " << result.message << "\n";
    os << std::left << std::setw(static_cast<int>(width)) << "Parameter" << "  " << std::right << std::setw(12)
       << "Value" << "  " << std::setw(12) << "Error" << "\n";
    os << std::fixed << std::setprecision(4);
    for (Eigen::Index i = 0; i < result.par.size(); ++i) {
        os << std::left << std::setw(static_cast<int>(width)) << names[static_cast<std::size_t>(i)] << "  "
           << std::right << std::setw(12) << result.par(i) << "  " << std::setw(12);
        if (!result.free(i)) {
            os << "fixed";
        } else if (result.par_err.has_value()) {
            os << (*result.par_err)(i);
        } else {
            os << "n/a";
        }
        os << "\n";
    }
    os << "Intrinsic velocity scatter: " << result.vel_scatter << "\n";
    os << "Number of velocity measurements: " << result.vel_nmeas << "\n";
    os << "Velocity chi-square: " << result.vel_chisqr << "\n";
    if (result.sig_nmeas > 0) {
        os << "Intrinsic dispersion scatter: " << result.sig_scatter << "\n";
        os << "Number of dispersion measurements: " << result.sig_nmeas << "\n";
        os << "Dispersion chi-square: " << result.sig_chisqr << "\n";
    }
    os << "Total chi-square: " << result.chisqr() << "\n";
    os << "Reduced chi-square: " << result.reduced_chisqr() << "\n";
    os.flags(flags);
}

} // namespace disk_fit
