#ifndef ONED_HPP
#define ONED_HPP

#include <Eigen/Core>
#include <cstddef>
#include <string>
#include <vector>

namespace disk_fit {

/**
 * @brief Interface of a one-dimensional radial profile family.
 *
 * Rotation curves, flow-amplitude curves, dispersion profiles and surface
 * brightness profiles used by the disk models all implement this
 * interface. Parameter vectors are owned by the caller; a profile only
 * defines the parameter layout, defaults, bounds and evaluation.
 */
class Func1D {
  public:
    virtual ~Func1D() = default;

    /// Number of parameters.
    virtual std::size_t np() const = 0;
    /// Default initial guess, length np().
    virtual Eigen::VectorXd guess_par() const = 0;
    /// Lower bounds, length np().
    virtual Eigen::VectorXd lb() const = 0;
    /// Upper bounds, length np().
    virtual Eigen::VectorXd ub() const = 0;
    /// Human-readable parameter names, length np().
    virtual std::vector<std::string> par_names(bool short_names = false) const = 0;

    /**
     * @brief Evaluate the profile at each radius.
     * @throws std::invalid_argument If @p par does not have np() elements.
     */
    Eigen::ArrayXd sample(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const;

  protected:
    virtual Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const = 0;
};

/// v tanh(r/h)
class HyperbolicTangent : public Func1D {
  public:
    std::size_t np() const override { return 2; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

/// a exp(-r/h)
class Exponential : public Func1D {
  public:
    std::size_t np() const override { return 2; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

/// b + a exp(-r/h)
class ExpBase : public Func1D {
  public:
    std::size_t np() const override { return 3; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

/// Constant value; the bounds are configurable so that a Const(0, 0, 0)
/// can stand in for a flow component that should vanish.
class Const : public Func1D {
  public:
    Const() = default;
    Const(double guess, double lower, double upper);

    std::size_t np() const override { return 1; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;

  private:
    double guess_ = 100.0;
    double lower_ = -500.0;
    double upper_ = 500.0;
};

/// Polyex rotation curve (Giovanelli & Haynes 2002): v (1 - exp(-r/h)) (1 + alpha r/h)
class PolyEx : public Func1D {
  public:
    std::size_t np() const override { return 3; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

/// a (r/h)^alpha exp(-r/h); the default family for second-order flows.
class PowerExp : public Func1D {
  public:
    std::size_t np() const override { return 3; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

/**
 * @brief Sersic profile I_e exp(-b_n((r/r_e)^(1/n) - 1)).
 *
 * b_n is chosen so that r_e encloses half of the total light.
 */
class Sersic1D : public Func1D {
  public:
    std::size_t np() const override { return 3; }
    Eigen::VectorXd guess_par() const override;
    Eigen::VectorXd lb() const override;
    Eigen::VectorXd ub() const override;
    std::vector<std::string> par_names(bool short_names = false) const override;

    /// The Sersic b_n coefficient.
    static double bn(double n);

  protected:
    Eigen::ArrayXd evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const override;
};

} // namespace disk_fit

#endif // ONED_HPP
