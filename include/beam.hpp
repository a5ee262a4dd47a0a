#ifndef BEAM_HPP
#define BEAM_HPP

#include "array_types.hpp"
#include <complex>
#include <optional>
#include <unsupported/Eigen/FFT>
#include <vector>

namespace disk_fit {

/**
 * @brief Reusable 2D FFT engine for square maps.
 *
 * Holds the Eigen FFT plans and scratch buffers so that repeated
 * convolutions of maps with the same shape (e.g. inside a fit loop) do not
 * re-plan the transform.
 */
class ConvolveFFT {
  public:
    ConvolveFFT() = default;

    /// Forward 2D transform of a real map.
    ComplexMap2D fft(const Map2D &data);
    /// Forward 2D transform of a complex map.
    ComplexMap2D fft(const ComplexMap2D &data);
    /// Inverse 2D transform (normalized by 1/N).
    ComplexMap2D ifft(const ComplexMap2D &data);

    /**
     * @brief Convolve a map with a kernel given by its FFT.
     *
     * The convolution is circular; the kernel FFT must have been computed
     * from a kernel whose center was shifted to index (0,0).
     *
     * @throws std::invalid_argument If the shapes of @p data and @p kernel_fft differ.
     */
    Map2D convolve(const Map2D &data, const ComplexMap2D &kernel_fft);

  private:
    Eigen::FFT<double> engine_;
    std::vector<std::complex<double>> in_;
    std::vector<std::complex<double>> out_;

    ComplexMap2D transform(const ComplexMap2D &data, bool inverse);
};

/// Shift the map center (index n/2) to index 0 along both axes.
template<typename Derived>
typename Derived::PlainObject
ifftshift(const Eigen::ArrayBase<Derived> &map) {
    typename Derived::PlainObject out(map.rows(), map.cols());
    Eigen::Index const nr = map.rows();
    Eigen::Index const nc = map.cols();
    for (Eigen::Index i = 0; i < nr; ++i) {
        for (Eigen::Index j = 0; j < nc; ++j) { out(i, j) = map((i + nr / 2) % nr, (j + nc / 2) % nc); }
    }
    return out;
}

/// Inverse of ifftshift: move index 0 to the map center.
template<typename Derived>
typename Derived::PlainObject
fftshift(const Eigen::ArrayBase<Derived> &map) {
    typename Derived::PlainObject out(map.rows(), map.cols());
    Eigen::Index const nr = map.rows();
    Eigen::Index const nc = map.cols();
    for (Eigen::Index i = 0; i < nr; ++i) {
        for (Eigen::Index j = 0; j < nc; ++j) { out((i + nr / 2) % nr, (j + nc / 2) % nc) = map(i, j); }
    }
    return out;
}

/**
 * @brief Effective smoothing kernel built from a seeing PSF and an aperture image.
 */
struct Beam {
    Map2D beam;           ///< Kernel image, centered at index (n/2, n/2).
    ComplexMap2D beam_fft; ///< FFT of the kernel after shifting its center to (0,0).
};

/**
 * @brief Construct the convolution of a PSF image with an aperture image.
 *
 * Both images are normalized to unit sum before convolution.
 *
 * @throws std::invalid_argument If the images do not have the same shape.
 */
Beam
construct_beam(const Map2D &psf, const Map2D &aperture, ConvolveFFT *cnv = nullptr);

/**
 * @brief Circular 2D Gaussian kernel normalized to unit sum.
 *
 * @param n Size of the (square) kernel image.
 * @param fwhm Full-width at half maximum in the same units as @p pixelscale.
 * @param pixelscale Size of one pixel.
 */
Map2D
gauss2d_kernel(Eigen::Index n, double fwhm, double pixelscale = 1.0);

/**
 * @brief Beam-smeared moments of a model.
 */
struct SmearedMoments {
    std::optional<Map2D> sb; ///< Smeared surface brightness (only if a surface brightness was provided).
    Map2D vel;               ///< Flux-weighted first moment.
    std::optional<Map2D> sig; ///< Flux-weighted dispersion (only if a dispersion was provided).
};

/**
 * @brief Beam-smear a velocity field and, optionally, a dispersion field.
 *
 * The velocity is smeared as a flux-weighted first moment. When a
 * dispersion field is given, the second moment (sig^2 + v^2) is smeared
 * jointly with the first so that the returned dispersion includes the
 * broadening produced by unresolved velocity gradients.
 *
 * @param v Intrinsic line-of-sight velocity field.
 * @param beam_fft FFT of the smoothing kernel, with the kernel center shifted to (0,0).
 * @param sb Optional surface-brightness weights; uniform if null.
 * @param sig Optional intrinsic dispersion field.
 * @param cnv Optional reusable FFT engine.
 * @throws std::invalid_argument If any of the maps differ in shape from @p v.
 */
SmearedMoments
smear(const Map2D &v,
      const ComplexMap2D &beam_fft,
      const Map2D *sb = nullptr,
      const Map2D *sig = nullptr,
      ConvolveFFT *cnv = nullptr);

/// As above, but with the smoothing kernel given as a centered image.
SmearedMoments
smear(const Map2D &v,
      const Map2D &beam,
      const Map2D *sb = nullptr,
      const Map2D *sig = nullptr,
      ConvolveFFT *cnv = nullptr);

} // namespace disk_fit

#endif // BEAM_HPP
