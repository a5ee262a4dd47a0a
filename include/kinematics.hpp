#ifndef KINEMATICS_HPP
#define KINEMATICS_HPP

#include "array_types.hpp"
#include <Eigen/Core>
#include <Eigen/SparseCore>
#include <optional>
#include <string>

namespace disk_fit {

/// Sparse operator that maps a flattened pixel-space map to the binned measurements.
using BinTransform = Eigen::SparseMatrix<double, Eigen::RowMajor>;
/// Pixel-space covariance matrix of a flattened N x N map.
using PixelCovariance = Eigen::SparseMatrix<double, Eigen::RowMajor>;

/**
 * @brief Raw maps used to construct a Kinematics object.
 *
 * Every provided map must have the (square) shape of @c vel. Maps given as
 * MaskedMap contribute their mask to the bad-pixel mask of the associated
 * measurement.
 */
struct KinematicsInput {
    MaskedMap vel; ///< Line-of-sight velocity (required).
    std::optional<MaskedMap> vel_ivar;
    std::optional<BoolMap> vel_mask;

    /// On-sky coordinates of each measurement; both or neither.
    std::optional<Map2D> x;
    std::optional<Map2D> y;

    std::optional<MaskedMap> sb; ///< Surface brightness of the kinematic tracer.
    std::optional<MaskedMap> sb_ivar;
    std::optional<BoolMap> sb_mask;

    std::optional<MaskedMap> sig; ///< Observed velocity dispersion.
    std::optional<MaskedMap> sig_ivar;
    std::optional<BoolMap> sig_mask;
    /// Quadrature correction; the astrophysical dispersion is sig^2 - sig_corr^2.
    std::optional<MaskedMap> sig_corr;

    /// Pixel-space covariance of the velocity and dispersion maps (N^2 x N^2).
    std::optional<PixelCovariance> vel_covar;
    std::optional<PixelCovariance> sig_covar;

    std::optional<Map2D> psf;      ///< Seeing kernel (or effective kernel if no aperture).
    std::optional<Map2D> aperture; ///< Spectrograph aperture image.

    /// Bin id of each pixel; -1 marks pixels that belong to no bin.
    std::optional<IntMap> binid;
    /// Coordinates of every pixel; required if the data are binned.
    std::optional<Map2D> grid_x;
    std::optional<Map2D> grid_y;

    std::optional<double> reff; ///< Effective radius, same units as x and y.
    std::optional<double> fwhm; ///< FWHM of the PSF, same units as x and y.
    std::optional<BoolMap> bordermask;
};

/**
 * @brief Auxiliary settings used by fitting and sampling drivers.
 */
struct FitArgs {
    Eigen::ArrayXd edges; ///< Radial bin edges for non-parametric profiles.
    bool fixcent = false; ///< Fix the kinematic center during the fit.
    bool disp = false;    ///< Fit the velocity dispersion.
};

/**
 * @brief Parameters of a synthetic disk galaxy (see Kinematics::mock).
 *
 * The velocity components and dispersion are given at the centers of
 * vt.size() radial bins that evenly span [0, maxr].
 */
struct MockGalaxy {
    Eigen::Index size = 30; ///< Pixels along each side of the region of interest.
    double inc = 45.0;      ///< Inclination in degrees.
    double pa = 45.0;       ///< Position angle in degrees.
    double pab = 0.0;       ///< In-plane angle of the bisymmetric flow, in degrees.
    double vsys = 0.0;      ///< Systemic velocity.
    Eigen::ArrayXd vt;      ///< First-order tangential velocity.
    Eigen::ArrayXd v2t;     ///< Second-order tangential velocity.
    Eigen::ArrayXd v2r;     ///< Second-order radial velocity.
    Eigen::ArrayXd sig;     ///< Velocity dispersion.
    double xc = 0.0;
    double yc = 0.0;
    double reff = 10.0;
    double maxr = 15.0; ///< Half-width of the region of interest.
    std::optional<Map2D> psf; ///< size x size PSF; a Gaussian of width fwhm if absent.
    double border = 3.0; ///< Width of the padding border in units of fwhm; 0 for none.
    double fwhm = 2.44;
};

/**
 * @brief Observed 2D kinematics (velocity and, optionally, dispersion and
 * surface brightness), pixel-resolved or spatially binned.
 *
 * Measurement vectors hold one entry per unique measurement (one per bin,
 * or one per pixel for unbinned data). The grid attributes describe the
 * full N x N pixel grid on which models are evaluated; remap() and bin()
 * move data between the two representations.
 */
class Kinematics {
  public:
    /**
     * @brief Ingest the raw maps.
     *
     * @throws std::invalid_argument If @c vel is not square, if any map does
     * not match the shape of @c vel, if only one of x and y is given, if
     * binid is given without both grid_x and grid_y, if binid contains ids
     * below -1, or if a covariance matrix does not have N^2 x N^2 elements.
     */
    explicit Kinematics(const KinematicsInput &input);

    /**
     * @brief Generate a noiseless mock galaxy.
     *
     * Evaluates the second-order (Spekkens & Sellwood 2007) velocity field
     * on a grid padded by a border of MockGalaxy::border FWHMs, which absorbs
     * the edge effects of the beam convolution. The border pixels are
     * recorded in bordermask() but only masked once border() is called.
     *
     * @throws std::invalid_argument If the profile arrays differ in length or are empty.
     */
    static Kinematics mock(const MockGalaxy &galaxy);

    // --- Remapping and binning ---

    /**
     * @brief Remap a named per-measurement attribute onto the full 2D grid.
     *
     * Cells not covered by any measurement are masked (or zero if
     * @p masked is false). For "vel", "sig" and "sb" the measurement mask
     * is included.
     *
     * @return The remapped map, or std::nullopt if the attribute exists but
     * was not provided.
     * @throws std::out_of_range If the attribute name is unknown.
     */
    std::optional<MaskedMap> remap(const std::string &attr, bool masked = true) const;

    /**
     * @brief Remap a per-measurement vector onto the full 2D grid.
     * @throws std::invalid_argument If @p data does not have nmeas() elements.
     */
    MaskedMap remap(const Eigen::ArrayXd &data, bool masked = true) const;

    /**
     * @brief Aggregate a full-grid map into measurement space.
     * @throws std::invalid_argument If the map does not have the spatial shape.
     */
    Eigen::ArrayXd bin(const Map2D &data) const;

    /// Radius enclosing the extrema of the measurement coordinates.
    double max_radius() const;

    /**
     * @brief Mask the border pixels recorded by mock().
     * @throws std::runtime_error If no border mask is defined.
     */
    void border();

    // --- Fit configuration ---

    /**
     * @brief Set radial bin edges.
     *
     * @param inc Bin width, or the number of bins if @p nbin is true.
     * @param maxr Outer radius; max_radius() if not given.
     * @param nbin Interpret @p inc as a number of bins.
     */
    void setedges(double inc, std::optional<double> maxr = std::nullopt, bool nbin = false);
    void setfixcent(bool fixcent) { fitargs_.fixcent = fixcent; }
    void setdisp(bool disp) { fitargs_.disp = disp; }
    const FitArgs &fitargs() const { return fitargs_; }

    // --- Accessors ---

    Eigen::Index spatial_shape() const { return nimg_; } ///< Pixels along each side of the grid.
    Eigen::Index nmeas() const { return vel_.size(); }   ///< Number of unique measurements.

    const Eigen::ArrayXd &x() const { return x_; }
    const Eigen::ArrayXd &y() const { return y_; }

    const Eigen::ArrayXd &vel() const { return vel_; }
    const std::optional<Eigen::ArrayXd> &vel_ivar() const { return vel_ivar_; }
    const BoolVector &vel_mask() const { return vel_mask_; }
    const std::optional<Eigen::ArrayXd> &vel_err() const { return vel_err_; }
    const std::optional<Eigen::MatrixXd> &vel_covar() const { return vel_covar_; }

    const std::optional<Eigen::ArrayXd> &sig() const { return sig_; }
    const std::optional<Eigen::ArrayXd> &sig_ivar() const { return sig_ivar_; }
    const std::optional<BoolVector> &sig_mask() const { return sig_mask_; }
    const std::optional<Eigen::ArrayXd> &sig_corr() const { return sig_corr_; }
    const std::optional<Eigen::ArrayXd> &sig_err() const { return sig_err_; }
    const std::optional<Eigen::MatrixXd> &sig_covar() const { return sig_covar_; }
    const std::optional<Eigen::ArrayXd> &sig_phys2() const { return sig_phys2_; }
    const std::optional<Eigen::ArrayXd> &sig_phys2_ivar() const { return sig_phys2_ivar_; }
    const std::optional<Eigen::MatrixXd> &sig_phys2_covar() const { return sig_phys2_covar_; }

    const std::optional<Eigen::ArrayXd> &sb() const { return sb_; }
    const std::optional<Eigen::ArrayXd> &sb_ivar() const { return sb_ivar_; }
    const std::optional<BoolVector> &sb_mask() const { return sb_mask_; }

    const std::optional<Map2D> &beam() const { return beam_; }
    const std::optional<ComplexMap2D> &beam_fft() const { return beam_fft_; }

    /// Unique bin ids (sorted), if the data are binned.
    const std::optional<Eigen::ArrayXi> &binid() const { return binid_; }
    const Map2D &grid_x() const { return grid_x_; }
    const Map2D &grid_y() const { return grid_y_; }
    /// Flattened indices of the grid cells that belong to a measurement.
    const IndexVector &grid_indx() const { return grid_indx_; }
    /// Measurement index of each cell listed in grid_indx().
    const IndexVector &bin_inverse() const { return bin_inverse_; }
    const BinTransform &bin_transform() const { return bin_transform_; }

    std::optional<double> reff() const { return reff_; }
    std::optional<double> fwhm() const { return fwhm_; }
    const std::optional<BoolVector> &bordermask() const { return bordermask_; }

  private:
    Eigen::Index nimg_ = 0;

    Eigen::ArrayXd x_;
    Eigen::ArrayXd y_;

    Eigen::ArrayXd vel_;
    std::optional<Eigen::ArrayXd> vel_ivar_;
    BoolVector vel_mask_;
    std::optional<Eigen::ArrayXd> vel_err_;
    std::optional<Eigen::MatrixXd> vel_covar_;

    std::optional<Eigen::ArrayXd> sig_;
    std::optional<Eigen::ArrayXd> sig_ivar_;
    std::optional<BoolVector> sig_mask_;
    std::optional<Eigen::ArrayXd> sig_corr_;
    std::optional<Eigen::ArrayXd> sig_err_;
    std::optional<Eigen::MatrixXd> sig_covar_;
    std::optional<Eigen::ArrayXd> sig_phys2_;
    std::optional<Eigen::ArrayXd> sig_phys2_ivar_;
    std::optional<Eigen::MatrixXd> sig_phys2_covar_;

    std::optional<Eigen::ArrayXd> sb_;
    std::optional<Eigen::ArrayXd> sb_ivar_;
    std::optional<BoolVector> sb_mask_;

    std::optional<Map2D> beam_;
    std::optional<ComplexMap2D> beam_fft_;

    std::optional<Eigen::ArrayXi> binid_;
    Map2D grid_x_;
    Map2D grid_y_;
    IndexVector grid_indx_;
    IndexVector bin_inverse_;
    BinTransform bin_transform_;

    std::optional<double> reff_;
    std::optional<double> fwhm_;
    std::optional<BoolVector> bordermask_;

    FitArgs fitargs_;

    void set_beam(const std::optional<Map2D> &psf, const std::optional<Map2D> &aperture);
    /// Flattened measurement indices selected for each unique measurement.
    IndexVector set_binning(const std::optional<IntMap> &binid);
    void set_derived();
};

} // namespace disk_fit

#endif // KINEMATICS_HPP
