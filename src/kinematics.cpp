#include "kinematics.hpp"
#include "beam.hpp"
#include "covariance.hpp"
#include "geometry.hpp"
#include "oned.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map> // For the bin id lookup
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace disk_fit {

namespace {

// Data, inverse variance and combined bad-pixel mask of one measured quantity
struct Ingested {
    Map2D data;
    std::optional<Map2D> ivar;
    BoolMap mask;
};

std::optional<Ingested>
ingest(const std::optional<MaskedMap> &data,
       const std::optional<MaskedMap> &ivar,
       const std::optional<BoolMap> &mask,
       Eigen::Index n) {
    if (!data.has_value()) { return std::nullopt; }

    Ingested result;
    result.mask = mask.has_value() ? *mask : BoolMap(BoolMap::Constant(n, n, false));
    result.mask = result.mask || data->mask;
    result.data = data->data;
    if (ivar.has_value()) {
        result.mask = result.mask || ivar->mask;
        result.ivar = ivar->data;
        // Any measurement without a positive inverse variance is unusable
        result.mask = result.mask || !(ivar->data > 0.0);
    }
    return result;
}

template<typename Derived>
Eigen::Array<typename Derived::Scalar, Eigen::Dynamic, 1>
take(const Eigen::ArrayBase<Derived> &map, const IndexVector &indx) {
    auto const flat = ravel(map);
    Eigen::Array<typename Derived::Scalar, Eigen::Dynamic, 1> out(indx.size());
    for (Eigen::Index k = 0; k < indx.size(); ++k) { out(k) = flat(indx(k)); }
    return out;
}

Eigen::MatrixXd
subset_covariance(const PixelCovariance &covar, const IndexVector &indx, Eigen::Index npix) {
    std::vector<Eigen::Index> position(static_cast<std::size_t>(npix), -1);
    for (Eigen::Index k = 0; k < indx.size(); ++k) { position[static_cast<std::size_t>(indx(k))] = k; }

    Eigen::MatrixXd subset = Eigen::MatrixXd::Zero(indx.size(), indx.size());
    for (Eigen::Index row = 0; row < covar.outerSize(); ++row) {
        Eigen::Index const i = position[static_cast<std::size_t>(row)];
        if (i < 0) { continue; }
        for (PixelCovariance::InnerIterator it(covar, row); it; ++it) {
            Eigen::Index const j = position[static_cast<std::size_t>(it.col())];
            if (j >= 0) { subset(i, j) = it.value(); }
        }
    }
    return subset;
}

// Linear interpolation with constant extrapolation beyond the end points
Map2D
interp(const Map2D &x, const Eigen::ArrayXd &xp, const Eigen::ArrayXd &fp) {
    Map2D out(x.rows(), x.cols());
    std::vector<double> const knots(xp.data(), xp.data() + xp.size());
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        for (Eigen::Index j = 0; j < x.cols(); ++j) {
            double const v = x(i, j);
            if (v <= knots.front()) {
                out(i, j) = fp(0);
                continue;
            }
            if (v >= knots.back()) {
                out(i, j) = fp(fp.size() - 1);
                continue;
            }
            auto const upper = std::upper_bound(knots.begin(), knots.end(), v);
            auto const k = static_cast<Eigen::Index>(upper - knots.begin());
            double const w = (v - xp(k - 1)) / (xp(k) - xp(k - 1));
            out(i, j) = fp(k - 1) + w * (fp(k) - fp(k - 1));
        }
    }
    return out;
}

} // namespace

Kinematics::Kinematics(const KinematicsInput &input) {
    const Map2D &vel = input.vel.data;
    if (vel.size() == 0) { throw std::invalid_argument("Velocity map provided to Kinematics is empty."); }
    if (vel.rows() != vel.cols()) { throw std::invalid_argument("Input arrays to Kinematics must be square."); }
    nimg_ = vel.rows();
    Eigen::Index const n = nimg_;
    Eigen::Index const npix = n * n;

    auto check_shape = [n](Eigen::Index rows, Eigen::Index cols, const std::string &name) {
        if (rows != n || cols != n) {
            throw std::invalid_argument("All arrays provided to Kinematics must have the same shape; " + name +
                                        " is " + std::to_string(rows) + "x" + std::to_string(cols) +
                                        ", expected " + std::to_string(n) + "x" + std::to_string(n) + ".");
        }
    };
    auto check_masked = [&](const std::optional<MaskedMap> &map, const std::string &name) {
        if (!map.has_value()) { return; }
        check_shape(map->data.rows(), map->data.cols(), name);
        check_shape(map->mask.rows(), map->mask.cols(), name + " mask");
    };
    check_shape(input.vel.mask.rows(), input.vel.mask.cols(), "vel mask");
    check_masked(input.vel_ivar, "vel_ivar");
    check_masked(input.sb, "sb");
    check_masked(input.sb_ivar, "sb_ivar");
    check_masked(input.sig, "sig");
    check_masked(input.sig_ivar, "sig_ivar");
    check_masked(input.sig_corr, "sig_corr");
    for (const auto &[map, name] : { std::make_pair(&input.vel_mask, "vel_mask"),
                                     std::make_pair(&input.sb_mask, "sb_mask"),
                                     std::make_pair(&input.sig_mask, "sig_mask"),
                                     std::make_pair(&input.bordermask, "bordermask") }) {
        if (map->has_value()) { check_shape((*map)->rows(), (*map)->cols(), name); }
    }
    for (const auto &[map, name] : { std::make_pair(&input.x, "x"),
                                     std::make_pair(&input.y, "y"),
                                     std::make_pair(&input.psf, "psf"),
                                     std::make_pair(&input.aperture, "aperture"),
                                     std::make_pair(&input.grid_x, "grid_x"),
                                     std::make_pair(&input.grid_y, "grid_y") }) {
        if (map->has_value()) { check_shape((*map)->rows(), (*map)->cols(), name); }
    }
    if (input.binid.has_value()) { check_shape(input.binid->rows(), input.binid->cols(), "binid"); }
    for (const auto &[covar, name] :
         { std::make_pair(&input.vel_covar, "vel_covar"), std::make_pair(&input.sig_covar, "sig_covar") }) {
        if (covar->has_value() && ((*covar)->rows() != npix || (*covar)->cols() != npix)) {
            throw std::invalid_argument(std::string("Covariance matrix ") + name + " must be " +
                                        std::to_string(npix) + "x" + std::to_string(npix) + ".");
        }
    }
    if (input.x.has_value() != input.y.has_value()) {
        throw std::invalid_argument("Must provide both x and y or neither.");
    }
    if (input.binid.has_value() && (!input.grid_x.has_value() || !input.grid_y.has_value())) {
        throw std::invalid_argument("If the data are binned, you must provide the pixel-by-pixel input "
                                    "coordinate grids, grid_x and grid_y.");
    }
    if (input.sig_covar.has_value() && !input.sig.has_value()) {
        throw std::invalid_argument("Dispersion covariance provided without dispersion measurements.");
    }

    set_beam(input.psf, input.aperture);
    reff_ = input.reff;
    fwhm_ = input.fwhm;

    // Default coordinates are sky-right (x increases toward lower column
    // index) with the origin at the center of the map
    Map2D x(n, n);
    Map2D y(n, n);
    if (input.x.has_value()) {
        x = *input.x;
        y = *input.y;
    } else {
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                x(i, j) = static_cast<double>((n - 1 - j) - n / 2);
                y(i, j) = static_cast<double>(i - n / 2);
            }
        }
    }

    std::optional<Ingested> const sb = ingest(input.sb, input.sb_ivar, input.sb_mask, n);
    std::optional<Ingested> const v = ingest(input.vel, input.vel_ivar, input.vel_mask, n);
    std::optional<Ingested> sig = ingest(input.sig, input.sig_ivar, input.sig_mask, n);
    if (sig.has_value() && input.sig_corr.has_value()) { sig->mask = sig->mask || input.sig_corr->mask; }

    grid_x_ = input.grid_x.has_value() ? *input.grid_x : x;
    grid_y_ = input.grid_y.has_value() ? *input.grid_y : y;

    IndexVector const indx = set_binning(input.binid);

    x_ = take(x, indx);
    y_ = take(y, indx);
    vel_ = take(v->data, indx);
    vel_mask_ = take(v->mask, indx);
    if (v->ivar.has_value()) { vel_ivar_ = take(*v->ivar, indx); }
    if (sb.has_value()) {
        sb_ = take(sb->data, indx);
        sb_mask_ = take(sb->mask, indx);
        if (sb->ivar.has_value()) { sb_ivar_ = take(*sb->ivar, indx); }
    }
    if (sig.has_value()) {
        sig_ = take(sig->data, indx);
        sig_mask_ = take(sig->mask, indx);
        if (sig->ivar.has_value()) { sig_ivar_ = take(*sig->ivar, indx); }
        if (input.sig_corr.has_value()) { sig_corr_ = take(input.sig_corr->data, indx); }
    }
    if (input.bordermask.has_value()) { bordermask_ = take(*input.bordermask, indx); }
    if (input.vel_covar.has_value()) { vel_covar_ = subset_covariance(*input.vel_covar, indx, npix); }
    if (input.sig_covar.has_value()) { sig_covar_ = subset_covariance(*input.sig_covar, indx, npix); }

    set_derived();
}

void
Kinematics::set_beam(const std::optional<Map2D> &psf, const std::optional<Map2D> &aperture) {
    if (!psf.has_value() && !aperture.has_value()) { return; }
    ConvolveFFT cnv;
    if (psf.has_value() && aperture.has_value()) {
        Beam beam = construct_beam(*psf, *aperture, &cnv);
        beam_ = std::move(beam.beam);
        beam_fft_ = std::move(beam.beam_fft);
        return;
    }
    beam_ = psf.has_value() ? *psf : *aperture;
    beam_fft_ = cnv.fft(Map2D(ifftshift(*beam_)));
}

IndexVector
Kinematics::set_binning(const std::optional<IntMap> &binid) {
    Eigen::Index const npix = nimg_ * nimg_;
    if (!binid.has_value()) {
        // Each pixel is its own bin
        grid_indx_ = IndexVector::LinSpaced(npix, 0, npix - 1);
        bin_inverse_ = grid_indx_;
        bin_transform_.resize(npix, npix);
        bin_transform_.setIdentity();
        return grid_indx_;
    }

    auto const flat = ravel(*binid);
    // Bin id -> (first flattened index, number of pixels)
    std::map<int, std::pair<Eigen::Index, Eigen::Index>> bins;
    for (Eigen::Index k = 0; k < npix; ++k) {
        int const id = flat(k);
        if (id < -1) {
            throw std::invalid_argument("Bin ids must be non-negative, or -1 for pixels that are not binned; found " +
                                        std::to_string(id) + ".");
        }
        if (id == -1) { continue; }
        auto it = bins.find(id);
        if (it == bins.end()) {
            bins.emplace(id, std::make_pair(k, Eigen::Index{ 1 }));
        } else {
            ++it->second.second;
        }
    }
    if (bins.empty()) { throw std::invalid_argument("Bin id map does not contain any valid bins."); }

    auto const nbin = static_cast<Eigen::Index>(bins.size());
    binid_ = Eigen::ArrayXi(nbin);
    IndexVector indx(nbin);
    std::map<int, Eigen::Index> position;
    Eigen::Index i = 0;
    for (const auto &[id, info] : bins) {
        (*binid_)(i) = id;
        indx(i) = info.first;
        position[id] = i;
        ++i;
    }

    Eigen::Index const nvalid = (flat != -1).count();
    grid_indx_.resize(nvalid);
    bin_inverse_.resize(nvalid);
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(static_cast<std::size_t>(nvalid));
    Eigen::Index g = 0;
    for (Eigen::Index k = 0; k < npix; ++k) {
        int const id = flat(k);
        if (id == -1) { continue; }
        Eigen::Index const b = position.at(id);
        grid_indx_(g) = k;
        bin_inverse_(g) = b;
        ++g;
        triplets.emplace_back(b, k, 1.0 / static_cast<double>(bins.at(id).second));
    }
    bin_transform_.resize(nbin, npix);
    bin_transform_.setFromTriplets(triplets.begin(), triplets.end());
    return indx;
}

void
Kinematics::set_derived() {
    if (vel_ivar_.has_value()) { vel_err_ = inverse(*vel_ivar_).sqrt(); }
    if (!sig_.has_value()) { return; }
    if (sig_ivar_.has_value()) { sig_err_ = inverse(*sig_ivar_).sqrt(); }

    sig_phys2_ = sig_->square();
    if (sig_corr_.has_value()) { *sig_phys2_ -= sig_corr_->square(); }
    if (sig_ivar_.has_value()) {
        // Error propagation for sig^2; the offset keeps zero dispersions finite
        Eigen::ArrayXd const jac = 2.0 * *sig_ + (*sig_ == 0.0).cast<double>();
        sig_phys2_ivar_ = *sig_ivar_ / jac.square();
    }
    if (sig_covar_.has_value()) {
        Eigen::VectorXd const jac = 2.0 * sig_->matrix();
        sig_phys2_covar_ = jac.asDiagonal() * (*sig_covar_) * jac.asDiagonal();
    }
}

std::optional<MaskedMap>
Kinematics::remap(const std::string &attr, bool masked) const {
    std::optional<Eigen::ArrayXd> values;
    const BoolVector *mask = nullptr;
    if (attr == "x") {
        values = x_;
    } else if (attr == "y") {
        values = y_;
    } else if (attr == "vel") {
        values = vel_;
        mask = &vel_mask_;
    } else if (attr == "vel_ivar") {
        values = vel_ivar_;
    } else if (attr == "vel_err") {
        values = vel_err_;
    } else if (attr == "vel_mask") {
        values = vel_mask_.cast<double>();
    } else if (attr == "sig") {
        values = sig_;
        if (sig_mask_.has_value()) { mask = &*sig_mask_; }
    } else if (attr == "sig_ivar") {
        values = sig_ivar_;
    } else if (attr == "sig_err") {
        values = sig_err_;
    } else if (attr == "sig_corr") {
        values = sig_corr_;
    } else if (attr == "sig_phys2") {
        values = sig_phys2_;
    } else if (attr == "sig_phys2_ivar") {
        values = sig_phys2_ivar_;
    } else if (attr == "sig_mask") {
        if (sig_mask_.has_value()) { values = sig_mask_->cast<double>(); }
    } else if (attr == "sb") {
        values = sb_;
        if (sb_mask_.has_value()) { mask = &*sb_mask_; }
    } else if (attr == "sb_ivar") {
        values = sb_ivar_;
    } else if (attr == "sb_mask") {
        if (sb_mask_.has_value()) { values = sb_mask_->cast<double>(); }
    } else if (attr == "bordermask") {
        if (bordermask_.has_value()) { values = bordermask_->cast<double>(); }
    } else {
        throw std::out_of_range("No attribute called " + attr + ".");
    }

    if (!values.has_value()) { return std::nullopt; }
    MaskedMap out = remap(*values, masked);
    if (masked && mask != nullptr) {
        for (Eigen::Index k = 0; k < grid_indx_.size(); ++k) {
            Eigen::Index const g = grid_indx_(k);
            out.mask(g / nimg_, g % nimg_) = (*mask)(bin_inverse_(k));
        }
    }
    return out;
}

MaskedMap
Kinematics::remap(const Eigen::ArrayXd &data, bool masked) const {
    if (data.size() != nmeas()) {
        throw std::invalid_argument("To remap, data must have the same length as the internal data attributes (" +
                                    std::to_string(nmeas()) + "); found " + std::to_string(data.size()) + ".");
    }
    MaskedMap out(Map2D(Map2D::Zero(nimg_, nimg_)), BoolMap(BoolMap::Constant(nimg_, nimg_, masked)));
    for (Eigen::Index k = 0; k < grid_indx_.size(); ++k) {
        Eigen::Index const g = grid_indx_(k);
        out.data(g / nimg_, g % nimg_) = data(bin_inverse_(k));
        out.mask(g / nimg_, g % nimg_) = false;
    }
    return out;
}

Eigen::ArrayXd
Kinematics::bin(const Map2D &data) const {
    if (data.rows() != nimg_ || data.cols() != nimg_) {
        throw std::invalid_argument("Data to rebin has incorrect shape; expected " + std::to_string(nimg_) + "x" +
                                    std::to_string(nimg_) + ", found " + std::to_string(data.rows()) + "x" +
                                    std::to_string(data.cols()) + ".");
    }
    Eigen::VectorXd const flat = ravel(data).matrix();
    Eigen::VectorXd const binned = bin_transform_ * flat;
    return binned.array();
}

double
Kinematics::max_radius() const {
    double const maxx = std::max(std::abs(x_.minCoeff()), x_.maxCoeff());
    double const maxy = std::max(std::abs(y_.minCoeff()), y_.maxCoeff());
    return std::sqrt(maxx * maxx + maxy * maxy);
}

void
Kinematics::border() {
    if (!bordermask_.has_value()) { throw std::runtime_error("Must set bordermask first."); }
    vel_mask_ = vel_mask_ || *bordermask_;
    if (sig_mask_.has_value()) { *sig_mask_ = *sig_mask_ || *bordermask_; }
    if (sb_mask_.has_value()) { *sb_mask_ = *sb_mask_ || *bordermask_; }
}

void
Kinematics::setedges(double inc, std::optional<double> maxr, bool nbin) {
    if (!(inc > 0)) { throw std::invalid_argument("Bin width or number of bins must be positive."); }
    double const outer = maxr.has_value() ? *maxr : max_radius();
    if (!(outer > 0)) { throw std::invalid_argument("Maximum radius for the bin edges must be positive."); }
    if (nbin) {
        auto const nb = static_cast<Eigen::Index>(std::lround(inc));
        if (nb < 1) { throw std::invalid_argument("Must request at least one radial bin."); }
        fitargs_.edges = Eigen::ArrayXd::LinSpaced(nb + 1, 0.0, outer);
        return;
    }
    auto const nb = static_cast<Eigen::Index>(std::ceil(outer / inc - 1e-10));
    fitargs_.edges = Eigen::ArrayXd::LinSpaced(nb + 1, 0.0, static_cast<double>(nb) * inc);
}

Kinematics
Kinematics::mock(const MockGalaxy &galaxy) {
    Eigen::Index const nbins = galaxy.vt.size();
    if (nbins == 0) { throw std::invalid_argument("Velocity arrays must not be empty."); }
    if (galaxy.v2t.size() != nbins || galaxy.v2r.size() != nbins || galaxy.sig.size() != nbins) {
        throw std::invalid_argument("Velocity arrays must be the same length.");
    }
    if (galaxy.size < 2) { throw std::invalid_argument("Mock galaxy must be at least 2 pixels on a side."); }
    if (!(galaxy.maxr > 0)) { throw std::invalid_argument("Mock galaxy maximum radius must be positive."); }
    if (galaxy.psf.has_value() && (galaxy.psf->rows() != galaxy.size || galaxy.psf->cols() != galaxy.size)) {
        throw std::invalid_argument("Mock galaxy PSF must be size x size.");
    }

    // Pad the grid with a border to absorb convolution edge effects; the
    // padding is kept symmetric so that the region of interest is exactly
    // size x size
    double extent = galaxy.maxr;
    Eigen::Index npad = galaxy.size;
    Eigen::Index bsize = 0;
    if (galaxy.border > 0) {
        extent = galaxy.maxr + galaxy.border * galaxy.fwhm;
        npad = static_cast<Eigen::Index>(extent / galaxy.maxr * static_cast<double>(galaxy.size)) + 1;
        if ((npad - galaxy.size) % 2 != 0) { ++npad; }
        bsize = (npad - galaxy.size) / 2;
    }

    Eigen::ArrayXd const a = Eigen::ArrayXd::LinSpaced(npad, -extent, extent);
    Map2D x(npad, npad);
    Map2D y(npad, npad);
    for (Eigen::Index i = 0; i < npad; ++i) {
        x.row(i) = a.transpose();
        y.row(i).setConstant(a(i));
    }

    double const inc = deg_to_rad(galaxy.inc);
    double const pa = deg_to_rad(galaxy.pa);
    double const pab = deg_to_rad(galaxy.pab);
    PolarCoordinates const polar = projected_polar(x - galaxy.xc, y - galaxy.yc, pa, inc);

    Eigen::ArrayXd const edges = Eigen::ArrayXd::LinSpaced(nbins + 1, 0.0, galaxy.maxr);
    Eigen::ArrayXd const centers = (edges.head(nbins) + edges.tail(nbins)) / 2.0;
    Map2D const vt = interp(polar.r, centers, galaxy.vt);
    Map2D const v2t = interp(polar.r, centers, galaxy.v2t);
    Map2D const v2r = interp(polar.r, centers, galaxy.v2r);
    Map2D const sig = interp(polar.r, centers, galaxy.sig);

    Sersic1D const sersic;
    Eigen::VectorXd sersic_par(3);
    sersic_par << 1.0, 10.0, 1.0;
    Eigen::ArrayXd const sb_flat = sersic.sample(ravel(polar.r), sersic_par);
    Map2D const sb = Eigen::Map<const Map2D>(sb_flat.data(), npad, npad);

    // Second-order velocity field (Spekkens & Sellwood 2007)
    Map2D const &th = polar.theta;
    Map2D const vel = galaxy.vsys + std::sin(inc) * (vt * th.cos() - v2t * (2.0 * (th - pab)).cos() * th.cos() -
                                                      v2r * (2.0 * (th - pab)).sin() * th.sin());

    Map2D psf = Map2D::Zero(npad, npad);
    if (galaxy.psf.has_value()) {
        psf.block(bsize, bsize, galaxy.size, galaxy.size) = *galaxy.psf;
    } else {
        double const pixelscale = 2.0 * extent / static_cast<double>(npad - 1);
        psf = gauss2d_kernel(npad, galaxy.fwhm, pixelscale);
    }

    BoolMap bordermask = BoolMap::Constant(npad, npad, galaxy.border > 0);
    if (galaxy.border > 0) { bordermask.block(bsize, bsize, galaxy.size, galaxy.size).setConstant(false); }

    IntMap binid(npad, npad);
    for (Eigen::Index k = 0; k < npad * npad; ++k) { binid(k / npad, k % npad) = static_cast<int>(k); }

    KinematicsInput input;
    input.vel = vel;
    input.x = x;
    input.y = y;
    input.grid_x = x;
    input.grid_y = y;
    input.reff = galaxy.reff;
    input.fwhm = galaxy.fwhm;
    input.binid = binid;
    input.sig = sig;
    input.psf = psf;
    input.sb = sb;
    input.bordermask = bordermask;
    return Kinematics(input);
}

} // namespace disk_fit
