#include "oned.hpp"
#include <boost/math/special_functions/gamma.hpp> // For gamma_p_inv in the Sersic b_n
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace disk_fit {

namespace {

Eigen::VectorXd
vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double const value : values) { v(i++) = value; }
    return v;
}

} // namespace

Eigen::ArrayXd
Func1D::sample(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    if (static_cast<std::size_t>(par.size()) != np()) {
        throw std::invalid_argument("Profile requires " + std::to_string(np()) + " parameters; found " +
                                    std::to_string(par.size()) + ".");
    }
    return evaluate(r, par);
}

// --- HyperbolicTangent ---

Eigen::VectorXd
HyperbolicTangent::guess_par() const {
    return vec({ 100.0, 10.0 });
}

Eigen::VectorXd
HyperbolicTangent::lb() const {
    return vec({ 0.0, 1e-3 });
}

Eigen::VectorXd
HyperbolicTangent::ub() const {
    return vec({ 500.0, 100.0 });
}

std::vector<std::string>
HyperbolicTangent::par_names(bool short_names) const {
    if (short_names) { return { "asymp", "scl" }; }
    return { "Asymptotic value", "Scale" };
}

Eigen::ArrayXd
HyperbolicTangent::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    return par(0) * (r / par(1)).tanh();
}

// --- Exponential ---

Eigen::VectorXd
Exponential::guess_par() const {
    return vec({ 100.0, 10.0 });
}

Eigen::VectorXd
Exponential::lb() const {
    return vec({ 0.0, 1e-3 });
}

Eigen::VectorXd
Exponential::ub() const {
    return vec({ 500.0, 100.0 });
}

std::vector<std::string>
Exponential::par_names(bool short_names) const {
    if (short_names) { return { "center", "h" }; }
    return { "Value at 0", "Scale length" };
}

Eigen::ArrayXd
Exponential::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    return par(0) * (-r / par(1)).exp();
}

// --- ExpBase ---

Eigen::VectorXd
ExpBase::guess_par() const {
    return vec({ 10.0, 100.0, 10.0 });
}

Eigen::VectorXd
ExpBase::lb() const {
    return vec({ 0.0, 0.0, 1e-3 });
}

Eigen::VectorXd
ExpBase::ub() const {
    return vec({ 500.0, 500.0, 100.0 });
}

std::vector<std::string>
ExpBase::par_names(bool short_names) const {
    if (short_names) { return { "base", "center", "h" }; }
    return { "Baseline", "Value above baseline at 0", "Scale length" };
}

Eigen::ArrayXd
ExpBase::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    return par(0) + par(1) * (-r / par(2)).exp();
}

// --- Const ---

Const::Const(double guess, double lower, double upper)
  : guess_(guess)
  , lower_(lower)
  , upper_(upper) {
    if (lower_ > upper_ || guess_ < lower_ || guess_ > upper_) {
        throw std::invalid_argument("Const profile guess must lie within its bounds.");
    }
}

Eigen::VectorXd
Const::guess_par() const {
    return vec({ guess_ });
}

Eigen::VectorXd
Const::lb() const {
    return vec({ lower_ });
}

Eigen::VectorXd
Const::ub() const {
    return vec({ upper_ });
}

std::vector<std::string>
Const::par_names(bool short_names) const {
    if (short_names) { return { "c" }; }
    return { "Constant" };
}

Eigen::ArrayXd
Const::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    return Eigen::ArrayXd::Constant(r.size(), par(0));
}

// --- PolyEx ---

Eigen::VectorXd
PolyEx::guess_par() const {
    return vec({ 100.0, 10.0, 0.1 });
}

Eigen::VectorXd
PolyEx::lb() const {
    return vec({ 0.0, 1e-3, -1.0 });
}

Eigen::VectorXd
PolyEx::ub() const {
    return vec({ 500.0, 100.0, 1.0 });
}

std::vector<std::string>
PolyEx::par_names(bool short_names) const {
    if (short_names) { return { "v", "h", "alpha" }; }
    return { "Amplitude", "Scale", "Outer slope" };
}

Eigen::ArrayXd
PolyEx::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    Eigen::ArrayXd const s = r / par(1);
    return par(0) * (1.0 - (-s).exp()) * (1.0 + par(2) * s);
}

// --- PowerExp ---

Eigen::VectorXd
PowerExp::guess_par() const {
    return vec({ 10.0, 10.0, 1.0 });
}

Eigen::VectorXd
PowerExp::lb() const {
    return vec({ -500.0, 1e-3, 1e-3 });
}

Eigen::VectorXd
PowerExp::ub() const {
    return vec({ 500.0, 100.0, 10.0 });
}

std::vector<std::string>
PowerExp::par_names(bool short_names) const {
    if (short_names) { return { "a", "h", "alpha" }; }
    return { "Amplitude", "Scale", "Power" };
}

Eigen::ArrayXd
PowerExp::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    Eigen::ArrayXd const s = r / par(1);
    return par(0) * s.pow(par(2)) * (-s).exp();
}

// --- Sersic1D ---

double
Sersic1D::bn(double n) {
    if (!(n > 0)) { throw std::invalid_argument("Sersic index must be positive."); }
    return boost::math::gamma_p_inv(2.0 * n, 0.5);
}

Eigen::VectorXd
Sersic1D::guess_par() const {
    return vec({ 1.0, 10.0, 1.0 });
}

Eigen::VectorXd
Sersic1D::lb() const {
    return vec({ 0.0, 1e-3, 0.1 });
}

Eigen::VectorXd
Sersic1D::ub() const {
    return vec({ 1e6, 1e3, 10.0 });
}

std::vector<std::string>
Sersic1D::par_names(bool short_names) const {
    if (short_names) { return { "Ie", "reff", "n" }; }
    return { "Intensity at Reff", "Effective radius", "Sersic index" };
}

Eigen::ArrayXd
Sersic1D::evaluate(const Eigen::ArrayXd &r, const Eigen::VectorXd &par) const {
    double const b = bn(par(2));
    return par(0) * (-b * ((r / par(1)).pow(1.0 / par(2)) - 1.0)).exp();
}

} // namespace disk_fit
