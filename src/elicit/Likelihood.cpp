#include "elicit/Likelihood.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "elicit/FeatureEncoding.hpp"

namespace elicit {

static constexpr double kMinProbability = 1e-12;

static double logistic(double z) {
    if (z >= 0.0) return 1.0 / (1.0 + std::exp(-z));
    const double e = std::exp(z);
    return e / (1.0 + e);
}

LikelihoodCalculator::LikelihoodCalculator(double temperature) : m_temperature(temperature) {
    if (!(temperature > 0.0) || !std::isfinite(temperature)) {
        throw std::invalid_argument("LikelihoodCalculator: temperature must be > 0");
    }
}

FeatureVector LikelihoodCalculator::extract_features(const VignetteOption& option) {
    return encode_attributes(option.attributes);
}

double LikelihoodCalculator::choice_probability(const FeatureVector& theta,
                                                const FeatureVector& features_a,
                                                const FeatureVector& features_b) const {
    const double z = m_temperature * theta.dot(features_a - features_b);
    return std::clamp(logistic(z), kMinProbability, 1.0 - kMinProbability);
}

int LikelihoodCalculator::chosen_index(const Vignette& vignette, const std::string& chosen_option_id) {
    for (int i = 0; i < 2; ++i) {
        if (vignette.options[i].option_id == chosen_option_id) return i;
    }
    throw std::invalid_argument("vignette " + vignette.vignette_id + " has no option '" + chosen_option_id + "'");
}

double LikelihoodCalculator::likelihood(const FeatureVector& theta,
                                        const Vignette& vignette,
                                        const std::string& chosen_option_id) const {
    const int k = chosen_index(vignette, chosen_option_id);
    const FeatureVector chosen = extract_features(vignette.options[k]);
    const FeatureVector other = extract_features(vignette.options[1 - k]);
    return choice_probability(theta, chosen, other);
}

LikelihoodFunction LikelihoodCalculator::create_likelihood_function(const Vignette& vignette,
                                                                    const std::string& chosen_option_id) const {
    const int k = chosen_index(vignette, chosen_option_id);
    const FeatureVector chosen = extract_features(vignette.options[k]);
    const FeatureVector other = extract_features(vignette.options[1 - k]);

    const LikelihoodCalculator calc = *this;
    return [calc, chosen, other](const FeatureVector& theta) {
        return calc.choice_probability(theta, chosen, other);
    };
}

}  // namespace elicit
