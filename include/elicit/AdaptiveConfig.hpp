#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "elicit/Models.hpp"
#include "elicit/PosteriorManager.hpp"
#include "elicit/StoppingCriterion.hpp"
#include "nlohmann/json.hpp"

namespace elicit {

// Thrown with every problem found, one per line.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::vector<std::string>& problems);

    const std::vector<std::string>& problems() const { return m_problems; }

private:
    std::vector<std::string> m_problems;
};

// Returns the value of an environment variable, nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& key)>;

EnvLookup process_env_lookup();

struct AdaptiveConfig {
    bool enabled = true;

    FeatureVector prior_mean = FeatureVector::Zero();
    double prior_variance = 1.0;

    int min_vignettes = 4;
    int max_vignettes = 12;
    double fim_det_threshold = 1e4;
    double max_variance_threshold = 0.65;

    double temperature = 1.0;
    int max_newton_iterations = 50;
    double convergence_tolerance = 1e-6;

    // weight candidate gains by posterior variance along their contrast
    bool bayesian_selection = false;

    double uncertainty_threshold = 0.3;
    double fim_regularization = 1e-8;
    double covariance_regularization = 1e-6;

    // ELICIT_* variables override defaults; throws ConfigError listing every bad key.
    static AdaptiveConfig from_env(const EnvLookup& lookup = process_env_lookup());

    std::vector<std::string> problems() const;
    void validate() const;

    InformationMatrix prior_covariance() const { return prior_variance * InformationMatrix::Identity(); }
    NewtonOptions newton_options() const;
    StoppingThresholds stopping_thresholds() const;

    nlohmann::json to_json() const;
};

}  // namespace elicit
