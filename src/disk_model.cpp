#include "disk_model.hpp"
#include <stdexcept>
#include <string>

namespace disk_fit {

namespace {

Map2D
sample_map(const Func1D &func, const Eigen::VectorXd &par, const Map2D &r) {
    Eigen::ArrayXd const values = func.sample(ravel(r), par);
    return Eigen::Map<const Map2D>(values.data(), r.rows(), r.cols());
}

void
check_length(Eigen::Index size, Eigen::Index expected, const std::string &what) {
    if (size != expected) {
        throw std::invalid_argument("Incorrect number of " + what + "; expected " + std::to_string(expected) +
                                    ", found " + std::to_string(size) + ".");
    }
}

} // namespace

DiskModel::DiskModel(std::vector<std::shared_ptr<const Func1D>> vc,
                     std::shared_ptr<const Func1D> dc,
                     std::vector<CurveLabel> labels)
  : vc_(std::move(vc))
  , dc_(std::move(dc))
  , labels_(std::move(labels)) {
    if (vc_.size() != labels_.size()) {
        throw std::invalid_argument("Each velocity curve of a disk model must have a label.");
    }
    for (const auto &curve : vc_) {
        if (curve == nullptr) { throw std::invalid_argument("Velocity curves of a disk model cannot be null."); }
    }
}

void
DiskModel::init_layout() {
    Eigen::Index start = nbp();
    vc_slices_.clear();
    for (const auto &curve : vc_) {
        auto const n = static_cast<Eigen::Index>(curve->np());
        vc_slices_.push_back({ start, n });
        start += n;
    }
    if (dc_ != nullptr) {
        dc_slice_ = { start, static_cast<Eigen::Index>(dc_->np()) };
        start += dc_slice_.size;
    }
    np_ = start;
    init_par();
}

const Func1D &
DiskModel::velocity_curve(std::size_t i) const {
    return *vc_.at(i);
}

Eigen::VectorXd
DiskModel::guess_par() const {
    Eigen::VectorXd p(np_);
    p.head(nbp()) = base_guess();
    for (std::size_t i = 0; i < vc_.size(); ++i) {
        p.segment(vc_slices_[i].start, vc_slices_[i].size) = vc_[i]->guess_par();
    }
    if (dc_ != nullptr) { p.segment(dc_slice_.start, dc_slice_.size) = dc_->guess_par(); }
    return p;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd>
DiskModel::par_bounds(const std::optional<Eigen::VectorXd> &base_lb,
                      const std::optional<Eigen::VectorXd> &base_ub) const {
    if ((!base_lb.has_value() || !base_ub.has_value()) && !has_grid()) {
        throw std::invalid_argument("No model grid defined; cannot set default bounds on the center.");
    }
    return par_bounds_for_grid(x_, y_, base_lb, base_ub);
}

std::pair<Eigen::VectorXd, Eigen::VectorXd>
DiskModel::par_bounds_for_grid(const Map2D &x,
                               const Map2D &y,
                               const std::optional<Eigen::VectorXd> &base_lb,
                               const std::optional<Eigen::VectorXd> &base_ub) const {
    if (base_lb.has_value()) { check_length(base_lb->size(), nbp(), "base lower bounds"); }
    if (base_ub.has_value()) { check_length(base_ub->size(), nbp(), "base upper bounds"); }

    Eigen::VectorXd lb(np_);
    Eigen::VectorXd ub(np_);
    if (!base_lb.has_value() || !base_ub.has_value()) {
        if (x.size() == 0 || y.size() == 0) {
            throw std::invalid_argument("No model grid defined; cannot set default bounds on the center.");
        }
        auto const defaults = base_bounds(x.minCoeff(), x.maxCoeff(), y.minCoeff(), y.maxCoeff());
        lb.head(nbp()) = defaults.first;
        ub.head(nbp()) = defaults.second;
    }
    if (base_lb.has_value()) { lb.head(nbp()) = *base_lb; }
    if (base_ub.has_value()) { ub.head(nbp()) = *base_ub; }

    for (std::size_t i = 0; i < vc_.size(); ++i) {
        lb.segment(vc_slices_[i].start, vc_slices_[i].size) = vc_[i]->lb();
        ub.segment(vc_slices_[i].start, vc_slices_[i].size) = vc_[i]->ub();
    }
    if (dc_ != nullptr) {
        lb.segment(dc_slice_.start, dc_slice_.size) = dc_->lb();
        ub.segment(dc_slice_.start, dc_slice_.size) = dc_->ub();
    }
    return { lb, ub };
}

void
DiskModel::init_par(const std::optional<Eigen::VectorXd> &p0, const std::optional<BoolVector> &fix) {
    if (p0.has_value()) { check_length(p0->size(), np_, "parameters"); }
    if (fix.has_value()) { check_length(fix->size(), np_, "fixed-parameter flags"); }
    par_ = p0.has_value() ? *p0 : guess_par();
    free_ = fix.has_value() ? BoolVector(!*fix) : BoolVector(BoolVector::Constant(np_, true));
    par_err_.reset();
    state_ = FitState::Unfit;
}

void
DiskModel::set_par(const Eigen::VectorXd &par) {
    if (par.size() == np_) {
        par_ = par;
        return;
    }
    if (par.size() == nfree()) {
        par_ = expand_par(par);
        return;
    }
    throw std::invalid_argument("Must provide " + std::to_string(np_) + " or " + std::to_string(nfree()) +
                                " parameters; found " + std::to_string(par.size()) + ".");
}

Eigen::VectorXd
DiskModel::expand_par(const Eigen::VectorXd &free_par) const {
    check_length(free_par.size(), nfree(), "free parameters");
    Eigen::VectorXd full = par_;
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < np_; ++i) {
        if (free_(i)) { full(i) = free_par(k++); }
    }
    return full;
}

void
DiskModel::apply(const FitResult &result) {
    check_length(result.par.size(), np_, "fitted parameters");
    check_length(result.free.size(), np_, "fitted free-parameter flags");
    if (result.par_err.has_value()) { check_length(result.par_err->size(), np_, "parameter errors"); }
    par_ = result.par;
    free_ = result.free;
    par_err_ = result.par_err;
    state_ = FitState::Fit;
}

void
DiskModel::reinit(const Map2D &x, const Map2D &y, std::optional<ComplexMap2D> beam_fft, std::optional<Map2D> sb) {
    if (x.rows() != y.rows() || x.cols() != y.cols()) {
        throw std::invalid_argument("Model x and y grids must have the same shape.");
    }
    if (beam_fft.has_value() && (beam_fft->rows() != x.rows() || beam_fft->cols() != x.cols())) {
        throw std::invalid_argument("Beam FFT must have the same shape as the model grid.");
    }
    if (sb.has_value() && (sb->rows() != x.rows() || sb->cols() != x.cols())) {
        throw std::invalid_argument("Surface brightness must have the same shape as the model grid.");
    }
    x_ = x;
    y_ = y;
    beam_fft_ = std::move(beam_fft);
    sb_ = std::move(sb);
}

ModelMaps
DiskModel::model(const std::optional<Eigen::VectorXd> &par,
                 const std::optional<Map2D> &x,
                 const std::optional<Map2D> &y,
                 const std::optional<ComplexMap2D> &beam_fft,
                 ConvolveFFT *cnv,
                 bool ignore_beam) {
    if (x.has_value() != y.has_value()) { throw std::invalid_argument("Must provide both x and y or neither."); }
    if (x.has_value()) {
        // Surface-brightness weights only apply to the grid they were set with
        bool const sb_matches = sb_.has_value() && sb_->rows() == x->rows() && sb_->cols() == x->cols();
        reinit(*x, *y, beam_fft.has_value() ? beam_fft : beam_fft_, sb_matches ? sb_ : std::nullopt);
    } else if (beam_fft.has_value()) {
        reinit(x_, y_, beam_fft, sb_);
    }
    if (par.has_value()) { set_par(*par); }
    if (!has_grid()) { throw std::runtime_error("No coordinate grid defined."); }
    return evaluate(par_,
                    x_,
                    y_,
                    beam_fft_.has_value() ? &*beam_fft_ : nullptr,
                    sb_.has_value() ? &*sb_ : nullptr,
                    cnv,
                    ignore_beam);
}

ModelMaps
DiskModel::evaluate(const Eigen::VectorXd &par,
                    const Map2D &x,
                    const Map2D &y,
                    const ComplexMap2D *beam_fft,
                    const Map2D *sb,
                    ConvolveFFT *cnv,
                    bool ignore_beam) const {
    check_length(par.size(), np_, "parameters");
    if (x.size() == 0) { throw std::runtime_error("No coordinate grid defined."); }

    PolarCoordinates const polar = projected_polar(x - par(0), y - par(1), deg_to_rad(par(2)), deg_to_rad(par(3)));

    ModelMaps maps;
    maps.vel = los_velocity(par, polar);
    if (dc_ != nullptr) { maps.sig = sample_map(*dc_, par.segment(dc_slice_.start, dc_slice_.size), polar.r); }
    if (ignore_beam || beam_fft == nullptr) { return maps; }

    SmearedMoments smeared = smear(maps.vel, *beam_fft, sb, maps.sig.has_value() ? &*maps.sig : nullptr, cnv);
    maps.vel = std::move(smeared.vel);
    maps.sig = std::move(smeared.sig);
    return maps;
}

Map2D
DiskModel::sample_curve(std::size_t i, const Eigen::VectorXd &par, const Map2D &r) const {
    const ParSlice &slice = vc_slices_.at(i);
    return sample_map(*vc_[i], par.segment(slice.start, slice.size), r);
}

std::vector<std::string>
DiskModel::par_names(bool short_names) const {
    std::vector<std::string> names = base_names(short_names);
    auto append = [&](const Func1D &curve, const CurveLabel &label) {
        for (const auto &name : curve.par_names(short_names)) {
            names.push_back(short_names ? label.short_name + "_" + name : label.long_name + ": " + name);
        }
    };
    for (std::size_t i = 0; i < vc_.size(); ++i) { append(*vc_[i], labels_[i]); }
    if (dc_ != nullptr) { append(*dc_, { "sig", "Dispersion" }); }
    return names;
}

ParSlice
DiskModel::velocity_slice(std::size_t i) const {
    return vc_slices_.at(i);
}

ParSlice
DiskModel::dispersion_slice() const {
    if (dc_ == nullptr) { throw std::logic_error("Model does not include a dispersion curve."); }
    return dc_slice_;
}

Eigen::VectorXd
DiskModel::slice_of(ParSlice slice, bool err) const {
    if (!err) { return par_.segment(slice.start, slice.size); }
    if (!par_err_.has_value()) { return Eigen::VectorXd::Zero(slice.size); }
    return par_err_->segment(slice.start, slice.size);
}

Eigen::VectorXd
DiskModel::base_par(bool err) const {
    return slice_of(base_slice(), err);
}

Eigen::VectorXd
DiskModel::velocity_par(std::size_t i, bool err) const {
    return slice_of(velocity_slice(i), err);
}

Eigen::VectorXd
DiskModel::dc_par(bool err) const {
    return slice_of(dispersion_slice(), err);
}

} // namespace disk_fit
