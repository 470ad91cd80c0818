#include "elicit/AdaptiveConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace elicit {

static std::string join_problems(const std::vector<std::string>& problems) {
    std::string msg = "invalid adaptive configuration:";
    for (const auto& p : problems) msg += "\n  - " + p;
    return msg;
}

ConfigError::ConfigError(const std::vector<std::string>& problems)
    : std::runtime_error(join_problems(problems)), m_problems(problems) {}

EnvLookup process_env_lookup() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static bool parse_double(const std::string& raw, double& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

static bool parse_int(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size() || v < -1000000000L || v > 1000000000L) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_bool(const std::string& raw, bool& out) {
    const std::string s = lower(trim(raw));
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

static bool parse_vector(const std::string& raw, FeatureVector& out) {
    std::vector<double> vals;
    std::stringstream ss(raw);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        double v = 0.0;
        if (!parse_double(tok, v)) return false;
        vals.push_back(v);
    }
    if (vals.size() != static_cast<size_t>(kNumDimensions)) return false;
    for (int i = 0; i < kNumDimensions; ++i) out[i] = vals[static_cast<size_t>(i)];
    return true;
}

AdaptiveConfig AdaptiveConfig::from_env(const EnvLookup& lookup) {
    AdaptiveConfig cfg;
    std::vector<std::string> problems;

    auto read_bool = [&](const char* key, bool& field) {
        if (auto v = lookup(key)) {
            if (!parse_bool(*v, field)) problems.push_back(std::string(key) + " must be a boolean, got '" + *v + "'");
        }
    };
    auto read_int = [&](const char* key, int& field) {
        if (auto v = lookup(key)) {
            if (!parse_int(*v, field)) problems.push_back(std::string(key) + " must be an integer, got '" + *v + "'");
        }
    };
    auto read_double = [&](const char* key, double& field) {
        if (auto v = lookup(key)) {
            if (!parse_double(*v, field)) problems.push_back(std::string(key) + " must be a number, got '" + *v + "'");
        }
    };

    read_bool("ELICIT_ADAPTIVE_ENABLED", cfg.enabled);

    if (auto v = lookup("ELICIT_PRIOR_MEAN")) {
        if (!parse_vector(*v, cfg.prior_mean)) {
            problems.push_back("ELICIT_PRIOR_MEAN must be " + std::to_string(kNumDimensions) +
                               " comma-separated numbers, got '" + *v + "'");
        }
    }

    read_double("ELICIT_PRIOR_VARIANCE", cfg.prior_variance);
    read_int("ELICIT_MIN_VIGNETTES", cfg.min_vignettes);
    read_int("ELICIT_MAX_VIGNETTES", cfg.max_vignettes);
    read_double("ELICIT_FIM_DET_THRESHOLD", cfg.fim_det_threshold);
    read_double("ELICIT_MAX_VARIANCE_THRESHOLD", cfg.max_variance_threshold);
    read_double("ELICIT_TEMPERATURE", cfg.temperature);
    read_int("ELICIT_MAX_NEWTON_ITERATIONS", cfg.max_newton_iterations);
    read_double("ELICIT_CONVERGENCE_TOLERANCE", cfg.convergence_tolerance);
    read_bool("ELICIT_BAYESIAN_SELECTION", cfg.bayesian_selection);
    read_double("ELICIT_UNCERTAINTY_THRESHOLD", cfg.uncertainty_threshold);
    read_double("ELICIT_FIM_REGULARIZATION", cfg.fim_regularization);
    read_double("ELICIT_COVARIANCE_REGULARIZATION", cfg.covariance_regularization);

    // only range-check values that parsed
    if (problems.empty()) problems = cfg.problems();
    if (!problems.empty()) throw ConfigError(problems);

    return cfg;
}

std::vector<std::string> AdaptiveConfig::problems() const {
    std::vector<std::string> p;

    if (!prior_mean.allFinite()) p.push_back("prior_mean must be finite");
    if (!(prior_variance > 0.0)) p.push_back("prior_variance must be > 0");
    if (min_vignettes < 1) p.push_back("min_vignettes must be >= 1");
    if (max_vignettes < min_vignettes) p.push_back("max_vignettes must be >= min_vignettes");
    if (!(fim_det_threshold > 0.0)) p.push_back("fim_det_threshold must be > 0");
    if (!(max_variance_threshold > 0.0)) p.push_back("max_variance_threshold must be > 0");
    if (!(temperature > 0.0)) p.push_back("temperature must be > 0");
    if (max_newton_iterations < 1) p.push_back("max_newton_iterations must be >= 1");
    if (!(convergence_tolerance > 0.0)) p.push_back("convergence_tolerance must be > 0");
    if (!(uncertainty_threshold > 0.0)) p.push_back("uncertainty_threshold must be > 0");
    if (!(fim_regularization >= 0.0)) p.push_back("fim_regularization must be >= 0");
    if (!(covariance_regularization >= 0.0)) p.push_back("covariance_regularization must be >= 0");

    return p;
}

void AdaptiveConfig::validate() const {
    const auto p = problems();
    if (!p.empty()) throw ConfigError(p);
}

NewtonOptions AdaptiveConfig::newton_options() const {
    NewtonOptions o;
    o.max_iterations = max_newton_iterations;
    o.convergence_tolerance = convergence_tolerance;
    o.covariance_regularization = covariance_regularization;
    return o;
}

StoppingThresholds AdaptiveConfig::stopping_thresholds() const {
    StoppingThresholds t;
    t.min_vignettes = min_vignettes;
    t.max_vignettes = max_vignettes;
    t.fim_det_threshold = fim_det_threshold;
    t.max_variance_threshold = max_variance_threshold;
    return t;
}

nlohmann::json AdaptiveConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;

    std::vector<double> mean(prior_mean.data(), prior_mean.data() + kNumDimensions);
    j["prior_mean"] = mean;
    j["prior_variance"] = prior_variance;

    j["min_vignettes"] = min_vignettes;
    j["max_vignettes"] = max_vignettes;
    j["fim_det_threshold"] = fim_det_threshold;
    j["max_variance_threshold"] = max_variance_threshold;

    j["temperature"] = temperature;
    j["max_newton_iterations"] = max_newton_iterations;
    j["convergence_tolerance"] = convergence_tolerance;

    j["bayesian_selection"] = bayesian_selection;
    j["uncertainty_threshold"] = uncertainty_threshold;
    j["fim_regularization"] = fim_regularization;
    j["covariance_regularization"] = covariance_regularization;
    return j;
}

}  // namespace elicit
