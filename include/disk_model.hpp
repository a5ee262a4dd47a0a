#ifndef DISK_MODEL_HPP
#define DISK_MODEL_HPP

#include "array_types.hpp"
#include "beam.hpp"
#include "fit_types.hpp"
#include "geometry.hpp"
#include "oned.hpp"
#include <Eigen/Core>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace disk_fit {

/// Model fields evaluated on the model grid.
struct ModelMaps {
    Map2D vel;
    std::optional<Map2D> sig; ///< Only for models with a dispersion curve.
};

/// Contiguous range of the parameter vector.
struct ParSlice {
    Eigen::Index start = 0;
    Eigen::Index size = 0;
};

enum class FitState { Unfit, Fit };

/**
 * @brief Common machinery of thin-disk kinematic models.
 *
 * The parameter vector is laid out as the model-specific base (geometric)
 * parameters, followed by the parameters of each velocity curve, followed
 * by the parameters of the dispersion curve (if any). The first four base
 * parameters are always the center (x, y), the position angle and the
 * inclination, both in degrees.
 *
 * The set of curves is fixed at construction, so the parameter layout
 * never changes over the lifetime of a model.
 */
class DiskModel {
  public:
    /// Label used to build parameter names for a profile.
    struct CurveLabel {
        std::string short_name;
        std::string long_name;
    };

    virtual ~DiskModel() = default;

    /// Number of base parameters.
    virtual Eigen::Index nbp() const = 0;
    /// Total number of parameters.
    Eigen::Index np() const { return np_; }
    Eigen::Index nfree() const { return free_.count(); }
    bool has_dispersion() const { return dc_ != nullptr; }
    std::size_t ncurves() const { return vc_.size(); }
    const Func1D &velocity_curve(std::size_t i) const;
    const Func1D *dispersion_curve() const { return dc_.get(); }

    /// Relative finite-difference step used when the fit configuration does not set one.
    virtual double default_diff_step() const = 0;

    Eigen::VectorXd guess_par() const;

    /**
     * @brief Lower and upper bounds of all parameters.
     *
     * Center bounds default to the extent of the model grid.
     *
     * @throws std::invalid_argument If an override has the wrong length, or
     *         if grid-based defaults are needed but no grid is set.
     */
    std::pair<Eigen::VectorXd, Eigen::VectorXd>
    par_bounds(const std::optional<Eigen::VectorXd> &base_lb = std::nullopt,
               const std::optional<Eigen::VectorXd> &base_ub = std::nullopt) const;
    /// As above, using the extent of the provided grid.
    std::pair<Eigen::VectorXd, Eigen::VectorXd>
    par_bounds_for_grid(const Map2D &x,
                        const Map2D &y,
                        const std::optional<Eigen::VectorXd> &base_lb = std::nullopt,
                        const std::optional<Eigen::VectorXd> &base_ub = std::nullopt) const;

    /**
     * @brief Reset the parameters and the free/fixed flags.
     *
     * Moves the model back to the unfit state.
     *
     * @throws std::invalid_argument If @p p0 or @p fix have the wrong length.
     */
    void init_par(const std::optional<Eigen::VectorXd> &p0 = std::nullopt,
                  const std::optional<BoolVector> &fix = std::nullopt);

    /**
     * @brief Set the parameters from a full or free-only vector.
     *
     * A free-only vector overwrites the free parameters and leaves the fixed
     * ones untouched.
     *
     * @throws std::invalid_argument If the length matches neither np() nor nfree().
     */
    void set_par(const Eigen::VectorXd &par);

    /// Full parameter vector with the free entries replaced by @p free_par.
    Eigen::VectorXd expand_par(const Eigen::VectorXd &free_par) const;

    const Eigen::VectorXd &par() const { return par_; }
    const BoolVector &free() const { return free_; }
    const std::optional<Eigen::VectorXd> &par_err() const { return par_err_; }
    FitState state() const { return state_; }

    /// Adopt the parameters and errors of a completed fit.
    void apply(const FitResult &result);

    /// Set the grid on which the model is evaluated, and optionally the beam and surface brightness.
    void reinit(const Map2D &x,
                const Map2D &y,
                std::optional<ComplexMap2D> beam_fft = std::nullopt,
                std::optional<Map2D> sb = std::nullopt);
    bool has_grid() const { return x_.size() > 0; }
    const Map2D &x() const { return x_; }
    const Map2D &y() const { return y_; }

    /**
     * @brief Evaluate the model with the stored grid, beam and parameters.
     *
     * Any of @p par, @p x and @p y (both or neither) and @p beam_fft replaces
     * the stored value before evaluation. A new grid keeps the stored beam
     * (which must match its shape) and drops a stored surface brightness of
     * a different shape. The returned fields are
     * beam-smeared unless no beam is set or @p ignore_beam is true.
     *
     * @throws std::runtime_error If no grid has been defined.
     */
    ModelMaps model(const std::optional<Eigen::VectorXd> &par = std::nullopt,
                    const std::optional<Map2D> &x = std::nullopt,
                    const std::optional<Map2D> &y = std::nullopt,
                    const std::optional<ComplexMap2D> &beam_fft = std::nullopt,
                    ConvolveFFT *cnv = nullptr,
                    bool ignore_beam = false);

    /**
     * @brief Stateless evaluation of the model for an explicit parameter vector and grid.
     * @throws std::invalid_argument If @p par does not have np() elements.
     * @throws std::runtime_error If the grid is empty.
     */
    ModelMaps evaluate(const Eigen::VectorXd &par,
                       const Map2D &x,
                       const Map2D &y,
                       const ComplexMap2D *beam_fft = nullptr,
                       const Map2D *sb = nullptr,
                       ConvolveFFT *cnv = nullptr,
                       bool ignore_beam = false) const;

    std::vector<std::string> par_names(bool short_names = false) const;

    ParSlice base_slice() const { return { 0, nbp() }; }
    ParSlice velocity_slice(std::size_t i) const;
    /// @throws std::logic_error If the model has no dispersion curve.
    ParSlice dispersion_slice() const;

    /// Base parameters, or their errors if @p err is true (zeros if errors are unavailable).
    Eigen::VectorXd base_par(bool err = false) const;
    Eigen::VectorXd velocity_par(std::size_t i, bool err = false) const;
    Eigen::VectorXd dc_par(bool err = false) const;

  protected:
    DiskModel(std::vector<std::shared_ptr<const Func1D>> vc,
              std::shared_ptr<const Func1D> dc,
              std::vector<CurveLabel> labels);

    /// Must be called by the derived constructor once nbp() is usable.
    void init_layout();

    virtual Eigen::VectorXd base_guess() const = 0;
    virtual std::pair<Eigen::VectorXd, Eigen::VectorXd>
    base_bounds(double minx, double maxx, double miny, double maxy) const = 0;
    virtual std::vector<std::string> base_names(bool short_names) const = 0;

    /// Line-of-sight velocity given the deprojected coordinates.
    virtual Map2D
    los_velocity(const Eigen::VectorXd &par, const PolarCoordinates &polar) const = 0;

    /// Sample velocity curve @p i of @p par at the radii of @p r.
    Map2D sample_curve(std::size_t i, const Eigen::VectorXd &par, const Map2D &r) const;

  private:
    std::vector<std::shared_ptr<const Func1D>> vc_;
    std::shared_ptr<const Func1D> dc_;
    std::vector<CurveLabel> labels_;
    std::vector<ParSlice> vc_slices_;
    ParSlice dc_slice_;
    Eigen::Index np_ = 0;

    Eigen::VectorXd par_;
    BoolVector free_;
    std::optional<Eigen::VectorXd> par_err_;
    FitState state_ = FitState::Unfit;

    Map2D x_;
    Map2D y_;
    std::optional<ComplexMap2D> beam_fft_;
    std::optional<Map2D> sb_;

    Eigen::VectorXd slice_of(ParSlice slice, bool err) const;
};

} // namespace disk_fit

#endif // DISK_MODEL_HPP
