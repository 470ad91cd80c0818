#pragma once

#include <string>
#include <vector>

#include "elicit/Likelihood.hpp"
#include "elicit/Models.hpp"

namespace elicit {

struct NewtonOptions {
    int max_iterations = 50;
    double convergence_tolerance = 1e-6;   // on ||theta_{k+1} - theta_k||
    double covariance_regularization = 1e-6;

    // central finite-difference steps for the log-likelihood derivatives
    double gradient_step = 1e-5;
    double hessian_step = 1e-4;
};

struct Observation {
    std::string vignette_id;
    std::string chosen_option_id;
};

struct UpdateDiagnostics {
    int iterations = 0;
    bool converged = false;
    bool regularized = false;           // diagonal loading was needed (step or covariance)
    bool covariance_retained = false;   // inverse Hessian unusable, previous covariance kept
    double objective = 0.0;             // negative log-posterior at the returned mean
};

// Laplace-approximated Gaussian posterior over the preference vector.
//
// Every update refits the MAP over all observations registered so far plus the
// Gaussian prior, so the result depends only on the prior and the observation
// sequence, not on how often update() was called in between.
class PosteriorManager {
public:
    PosteriorManager(const FeatureVector& prior_mean,
                     const InformationMatrix& prior_covariance,
                     NewtonOptions opts = {});

    const PreferenceEstimate& posterior() const { return m_post; }

    // Register the observation and refit mean and covariance.
    PreferenceEstimate update(LikelihoodFunction likelihood_fn, const Observation& observation);

    // Register a historical observation without refitting (replaying an event log).
    void add_observation(LikelihoodFunction likelihood_fn, const Observation& observation);

    size_t num_observations() const { return m_terms.size(); }
    const std::vector<Observation>& observations() const { return m_observations; }
    const UpdateDiagnostics& last_update() const { return m_last; }

    const FeatureVector& prior_mean() const { return m_prior_mean; }
    const InformationMatrix& prior_covariance() const { return m_prior_cov; }

    // Negative log-posterior (up to a constant) and its derivatives.
    double objective(const FeatureVector& theta) const;
    FeatureVector gradient(const FeatureVector& theta) const;
    InformationMatrix hessian(const FeatureVector& theta) const;

private:
    FeatureVector m_prior_mean;
    InformationMatrix m_prior_cov;
    InformationMatrix m_prior_precision;
    NewtonOptions m_opts;

    std::vector<LikelihoodFunction> m_terms;
    std::vector<Observation> m_observations;

    PreferenceEstimate m_post;
    UpdateDiagnostics m_last;

    double negative_log_likelihood(const FeatureVector& theta) const;
    bool solve_step(const InformationMatrix& hess, const FeatureVector& grad, FeatureVector& step, bool& regularized) const;
    bool covariance_at(const FeatureVector& theta, InformationMatrix& cov, bool& regularized) const;
};

}  // namespace elicit
