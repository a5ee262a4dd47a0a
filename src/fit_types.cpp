#include "fit_types.hpp"
#include <limits> // For quiet_NaN
#include <stdexcept>

namespace disk_fit {

namespace {

nlohmann::json
vector_to_json(const Eigen::VectorXd &v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

Eigen::VectorXd
vector_from_json(const nlohmann::json &j) {
    auto const values = j.get<std::vector<double>>();
    return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

nlohmann::json
flags_to_json(const BoolVector &v) {
    return std::vector<bool>(v.data(), v.data() + v.size());
}

BoolVector
flags_from_json(const nlohmann::json &j) {
    auto const values = j.get<std::vector<bool>>();
    BoolVector out(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i) { out(static_cast<Eigen::Index>(i)) = values[i]; }
    return out;
}

template<typename T, typename Convert>
nlohmann::json
optional_to_json(const std::optional<T> &value, Convert convert) {
    if (!value.has_value()) { return nullptr; }
    return convert(*value);
}

template<typename T, typename Convert>
void
optional_from_json(const nlohmann::json &j, const char *key, std::optional<T> &value, Convert convert) {
    if (!j.contains(key) || j.at(key).is_null()) {
        value.reset();
        return;
    }
    value = convert(j.at(key));
}

} // namespace

double
FitResult::reduced_chisqr() const {
    Eigen::Index const dof = vel_nmeas + sig_nmeas - nfree();
    if (dof <= 0) { return std::numeric_limits<double>::quiet_NaN(); }
    return chisqr() / static_cast<double>(dof);
}

void
to_json(nlohmann::json &j, const FitConfig &config) {
    j = nlohmann::json{ { "sb_wgt", config.sb_wgt },
                        { "p0", optional_to_json(config.p0, vector_to_json) },
                        { "fix", optional_to_json(config.fix, flags_to_json) },
                        { "lb", optional_to_json(config.lb, vector_to_json) },
                        { "ub", optional_to_json(config.ub, vector_to_json) },
                        { "scatter", config.scatter },
                        { "assume_posdef_covar", config.assume_posdef_covar },
                        { "ignore_covar", config.ignore_covar },
                        { "diff_step", config.diff_step.has_value() ? nlohmann::json(*config.diff_step) : nullptr },
                        { "max_iterations", config.max_iterations },
                        { "function_tolerance", config.function_tolerance },
                        { "gradient_tolerance", config.gradient_tolerance },
                        { "parameter_tolerance", config.parameter_tolerance },
                        { "verbose", config.verbose } };
}

void
from_json(const nlohmann::json &j, FitConfig &config) {
    if (!j.is_object()) { throw std::invalid_argument("Fit configuration must be a JSON object."); }
    config.sb_wgt = j.value("sb_wgt", config.sb_wgt);
    optional_from_json(j, "p0", config.p0, vector_from_json);
    optional_from_json(j, "fix", config.fix, flags_from_json);
    optional_from_json(j, "lb", config.lb, vector_from_json);
    optional_from_json(j, "ub", config.ub, vector_from_json);
    if (j.contains("scatter") && !j.at("scatter").is_null()) {
        const auto &scatter = j.at("scatter");
        config.scatter = scatter.is_number() ? std::vector<double>{ scatter.get<double>() }
                                             : scatter.get<std::vector<double>>();
    }
    config.assume_posdef_covar = j.value("assume_posdef_covar", config.assume_posdef_covar);
    config.ignore_covar = j.value("ignore_covar", config.ignore_covar);
    optional_from_json(j, "diff_step", config.diff_step, [](const nlohmann::json &v) { return v.get<double>(); });
    config.max_iterations = j.value("max_iterations", config.max_iterations);
    config.function_tolerance = j.value("function_tolerance", config.function_tolerance);
    config.gradient_tolerance = j.value("gradient_tolerance", config.gradient_tolerance);
    config.parameter_tolerance = j.value("parameter_tolerance", config.parameter_tolerance);
    config.verbose = j.value("verbose", config.verbose);
}

FitConfig
fit_config_from_json(const nlohmann::json &j) {
    FitConfig config;
    from_json(j, config);
    return config;
}

void
to_json(nlohmann::json &j, const FitResult &result) {
    j = nlohmann::json{ { "par", vector_to_json(result.par) },
                        { "free", flags_to_json(result.free) },
                        { "par_err", optional_to_json(result.par_err, vector_to_json) },
                        { "vel_scatter", result.vel_scatter },
                        { "sig_scatter", result.sig_scatter },
                        { "vel_nmeas", result.vel_nmeas },
                        { "sig_nmeas", result.sig_nmeas },
                        { "vel_chisqr", result.vel_chisqr },
                        { "sig_chisqr", result.sig_chisqr },
                        { "converged", result.converged },
                        { "iterations", result.iterations },
                        { "message", result.message } };
}

void
from_json(const nlohmann::json &j, FitResult &result) {
    result.par = vector_from_json(j.at("par"));
    result.free = flags_from_json(j.at("free"));
    if (result.free.size() != result.par.size()) {
        throw std::invalid_argument("Fit result 'free' flags must match the length of 'par'.");
    }
    optional_from_json(j, "par_err", result.par_err, vector_from_json);
    result.vel_scatter = j.value("vel_scatter", 0.0);
    result.sig_scatter = j.value("sig_scatter", 0.0);
    result.vel_nmeas = j.value("vel_nmeas", Eigen::Index{ 0 });
    result.sig_nmeas = j.value("sig_nmeas", Eigen::Index{ 0 });
    result.vel_chisqr = j.value("vel_chisqr", 0.0);
    result.sig_chisqr = j.value("sig_chisqr", 0.0);
    result.converged = j.value("converged", false);
    result.iterations = j.value("iterations", 0);
    result.message = j.value("message", std::string());
}

} // namespace disk_fit
