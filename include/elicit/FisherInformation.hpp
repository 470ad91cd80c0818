#pragma once

#include <vector>

#include "elicit/Likelihood.hpp"
#include "elicit/Models.hpp"

namespace elicit {

struct ExpectedInformation {
    InformationMatrix fim;
    // raw det(fim) - det(current), not a D-efficiency difference
    double determinant_increase = 0.0;
};

// Fisher information of binary logit choices: p(1-p) d d^T + reg * I.
class FisherInformationCalculator {
public:
    explicit FisherInformationCalculator(LikelihoodCalculator likelihood = LikelihoodCalculator(),
                                         double regularization = 1e-8);

    double regularization() const { return m_regularization; }
    const LikelihoodCalculator& likelihood() const { return m_likelihood; }

    InformationMatrix compute_fim(const Vignette& vignette, const FeatureVector& theta) const;
    InformationMatrix compute_fim(const FeatureVector& features_a,
                                  const FeatureVector& features_b,
                                  const FeatureVector& theta) const;

    // Sum over the vignettes; zero matrix for an empty list.
    InformationMatrix compute_cumulative_fim(const std::vector<const Vignette*>& vignettes,
                                             const FeatureVector& theta) const;

    ExpectedInformation compute_expected_fim(const Vignette& candidate,
                                             const FeatureVector& theta,
                                             const InformationMatrix& current) const;

    // Determinant gain scaled by 1 + d^T (covariance + 1e-8 I) d, where d is the
    // candidate's feature difference: contrasts along directions the posterior
    // is still unsure about score higher.
    ExpectedInformation compute_bayesian_expected_fim(const Vignette& candidate,
                                                      const FeatureVector& theta,
                                                      const InformationMatrix& covariance,
                                                      const InformationMatrix& current) const;

    static double determinant(const InformationMatrix& m);

    // Normalised D-efficiency det^(1/7), comparable across design sizes; 0 when
    // det <= 0. Use determinant() for the raw det that selection and stopping compare.
    static double d_efficiency(const InformationMatrix& m);

    static FeatureVector information_per_dimension(const InformationMatrix& m) { return m.diagonal(); }

private:
    LikelihoodCalculator m_likelihood;
    double m_regularization = 1e-8;
};

}  // namespace elicit
