#include "elicit/FisherInformation.hpp"

#include <cmath>
#include <stdexcept>

namespace elicit {

FisherInformationCalculator::FisherInformationCalculator(LikelihoodCalculator likelihood, double regularization)
    : m_likelihood(likelihood), m_regularization(regularization) {
    if (!(regularization >= 0.0) || !std::isfinite(regularization)) {
        throw std::invalid_argument("FisherInformationCalculator: regularization must be >= 0");
    }
}

InformationMatrix FisherInformationCalculator::compute_fim(const Vignette& vignette, const FeatureVector& theta) const {
    return compute_fim(LikelihoodCalculator::extract_features(vignette.options[0]),
                       LikelihoodCalculator::extract_features(vignette.options[1]),
                       theta);
}

InformationMatrix FisherInformationCalculator::compute_fim(const FeatureVector& fa,
                                                           const FeatureVector& fb,
                                                           const FeatureVector& theta) const {
    const FeatureVector d = fa - fb;

    const double p = m_likelihood.choice_probability(theta, fa, fb);

    return p * (1.0 - p) * (d * d.transpose()) + m_regularization * InformationMatrix::Identity();
}

InformationMatrix FisherInformationCalculator::compute_cumulative_fim(const std::vector<const Vignette*>& vignettes,
                                                                      const FeatureVector& theta) const {
    InformationMatrix total = InformationMatrix::Zero();
    for (const Vignette* v : vignettes) {
        if (!v) throw std::invalid_argument("FisherInformationCalculator: null vignette");
        total += compute_fim(*v, theta);
    }
    return total;
}

ExpectedInformation FisherInformationCalculator::compute_expected_fim(const Vignette& candidate,
                                                                      const FeatureVector& theta,
                                                                      const InformationMatrix& current) const {
    ExpectedInformation out;
    out.fim = current + compute_fim(candidate, theta);
    out.determinant_increase = determinant(out.fim) - determinant(current);
    return out;
}

ExpectedInformation FisherInformationCalculator::compute_bayesian_expected_fim(const Vignette& candidate,
                                                                               const FeatureVector& theta,
                                                                               const InformationMatrix& covariance,
                                                                               const InformationMatrix& current) const {
    ExpectedInformation out = compute_expected_fim(candidate, theta, current);

    const FeatureVector d = LikelihoodCalculator::extract_features(candidate.options[0]) -
                            LikelihoodCalculator::extract_features(candidate.options[1]);
    const InformationMatrix cov = covariance + 1e-8 * InformationMatrix::Identity();
    const double directional = d.dot(cov * d);

    out.determinant_increase *= 1.0 + directional;
    return out;
}

double FisherInformationCalculator::determinant(const InformationMatrix& m) {
    return m.determinant();
}

double FisherInformationCalculator::d_efficiency(const InformationMatrix& m) {
    const double det = m.determinant();
    if (!(det > 0.0) || !std::isfinite(det)) return 0.0;
    return std::pow(det, 1.0 / kNumDimensions);
}

}  // namespace elicit
