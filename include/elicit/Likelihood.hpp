#pragma once

#include <functional>
#include <string>

#include "elicit/Models.hpp"

namespace elicit {

// Probability of the observed choice as a function of the preference vector.
using LikelihoodFunction = std::function<double(const FeatureVector& theta)>;

// Binary logit choice model over the encoded options of a vignette.
class LikelihoodCalculator {
public:
    // temperature scales the utility difference; 1.0 is standard MNL.
    explicit LikelihoodCalculator(double temperature = 1.0);

    double temperature() const { return m_temperature; }

    static FeatureVector extract_features(const VignetteOption& option);

    // P(A) = logistic(temperature * theta . (fa - fb)), strictly inside (0,1).
    double choice_probability(const FeatureVector& theta,
                              const FeatureVector& features_a,
                              const FeatureVector& features_b) const;

    // Probability that the option with chosen_option_id is picked.
    double likelihood(const FeatureVector& theta,
                      const Vignette& vignette,
                      const std::string& chosen_option_id) const;

    // Bound to this vignette and choice; safe to outlive the vignette.
    LikelihoodFunction create_likelihood_function(const Vignette& vignette,
                                                  const std::string& chosen_option_id) const;

private:
    double m_temperature = 1.0;

    // index of chosen option in vignette.options, throws on unknown id
    static int chosen_index(const Vignette& vignette, const std::string& chosen_option_id);
};

}  // namespace elicit
