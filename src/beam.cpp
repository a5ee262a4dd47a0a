#include "beam.hpp"
#include <cmath>
#include <numbers> // For std::numbers::ln2
#include <stdexcept>
#include <string>

namespace disk_fit {

namespace {

void
check_shape(const Map2D &map, Eigen::Index rows, Eigen::Index cols, const std::string &name) {
    if (map.rows() != rows || map.cols() != cols) {
        throw std::invalid_argument("[smear] Shape of " + name + " (" + std::to_string(map.rows()) + "x" +
                                    std::to_string(map.cols()) + ") does not match the velocity field (" +
                                    std::to_string(rows) + "x" + std::to_string(cols) + ").");
    }
}

} // namespace

ComplexMap2D
ConvolveFFT::transform(const ComplexMap2D &data, bool inverse) {
    ComplexMap2D out = data;
    Eigen::Index const nr = data.rows();
    Eigen::Index const nc = data.cols();

    // Rows
    in_.resize(nc);
    for (Eigen::Index i = 0; i < nr; ++i) {
        for (Eigen::Index j = 0; j < nc; ++j) { in_[j] = out(i, j); }
        if (inverse) {
            engine_.inv(out_, in_);
        } else {
            engine_.fwd(out_, in_);
        }
        for (Eigen::Index j = 0; j < nc; ++j) { out(i, j) = out_[j]; }
    }
    // Columns
    in_.resize(nr);
    for (Eigen::Index j = 0; j < nc; ++j) {
        for (Eigen::Index i = 0; i < nr; ++i) { in_[i] = out(i, j); }
        if (inverse) {
            engine_.inv(out_, in_);
        } else {
            engine_.fwd(out_, in_);
        }
        for (Eigen::Index i = 0; i < nr; ++i) { out(i, j) = out_[i]; }
    }
    return out;
}

ComplexMap2D
ConvolveFFT::fft(const Map2D &data) {
    return transform(data.cast<std::complex<double>>(), false);
}

ComplexMap2D
ConvolveFFT::fft(const ComplexMap2D &data) {
    return transform(data, false);
}

ComplexMap2D
ConvolveFFT::ifft(const ComplexMap2D &data) {
    return transform(data, true);
}

Map2D
ConvolveFFT::convolve(const Map2D &data, const ComplexMap2D &kernel_fft) {
    if (data.rows() != kernel_fft.rows() || data.cols() != kernel_fft.cols()) {
        throw std::invalid_argument("[ConvolveFFT] Data and kernel FFT must have the same shape.");
    }
    ComplexMap2D const product = fft(data) * kernel_fft;
    return ifft(product).real();
}

Beam
construct_beam(const Map2D &psf, const Map2D &aperture, ConvolveFFT *cnv) {
    if (psf.rows() != aperture.rows() || psf.cols() != aperture.cols()) {
        throw std::invalid_argument("PSF and aperture images must have the same shape.");
    }
    ConvolveFFT local;
    ConvolveFFT &engine = cnv == nullptr ? local : *cnv;

    Map2D const psf_n = psf / psf.sum();
    Map2D const ap_n = aperture / aperture.sum();

    Beam result;
    result.beam_fft = engine.fft(Map2D(ifftshift(psf_n))) * engine.fft(Map2D(ifftshift(ap_n)));
    result.beam = fftshift(Map2D(engine.ifft(result.beam_fft).real()));
    return result;
}

Map2D
gauss2d_kernel(Eigen::Index n, double fwhm, double pixelscale) {
    if (n < 1) { throw std::invalid_argument("Kernel size must be positive."); }
    if (!(fwhm > 0)) { throw std::invalid_argument("Kernel FWHM must be positive."); }
    double const sigma = fwhm / (2.0 * std::sqrt(2.0 * std::numbers::ln2));
    Map2D kernel(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        double const y = static_cast<double>(i - n / 2) * pixelscale;
        for (Eigen::Index j = 0; j < n; ++j) {
            double const x = static_cast<double>(j - n / 2) * pixelscale;
            kernel(i, j) = std::exp(-0.5 * (x * x + y * y) / (sigma * sigma));
        }
    }
    return kernel / kernel.sum();
}

SmearedMoments
smear(const Map2D &v, const ComplexMap2D &beam_fft, const Map2D *sb, const Map2D *sig, ConvolveFFT *cnv) {
    if (beam_fft.rows() != v.rows() || beam_fft.cols() != v.cols()) {
        throw std::invalid_argument("[smear] Beam FFT must have the same shape as the velocity field.");
    }
    if (sb != nullptr) { check_shape(*sb, v.rows(), v.cols(), "surface brightness"); }
    if (sig != nullptr) { check_shape(*sig, v.rows(), v.cols(), "dispersion"); }

    ConvolveFFT local;
    ConvolveFFT &engine = cnv == nullptr ? local : *cnv;

    Map2D const weights = sb == nullptr ? Map2D(Map2D::Ones(v.rows(), v.cols())) : *sb;

    SmearedMoments moments;
    // Zeroth moment normalizes the flux-weighted higher moments
    Map2D const mom0 = engine.convolve(weights, beam_fft);
    if (sb != nullptr) { moments.sb = mom0; }
    moments.vel = engine.convolve(weights * v, beam_fft) / mom0;
    if (sig == nullptr) { return moments; }

    // Second moment about zero; the smeared dispersion is its spread about the smeared velocity
    Map2D const mom2 = engine.convolve(weights * (sig->square() + v.square()), beam_fft) / mom0;
    // Round-off can make the variance marginally negative where the field is flat
    moments.sig = (mom2 - moments.vel.square()).max(0.0).sqrt();
    return moments;
}

SmearedMoments
smear(const Map2D &v, const Map2D &beam, const Map2D *sb, const Map2D *sig, ConvolveFFT *cnv) {
    ConvolveFFT local;
    ConvolveFFT &engine = cnv == nullptr ? local : *cnv;
    ComplexMap2D const beam_fft = engine.fft(Map2D(ifftshift(beam)));
    return smear(v, beam_fft, sb, sig, &engine);
}

} // namespace disk_fit
