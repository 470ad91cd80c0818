#include "elicit/PosteriorManager.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace elicit {

PosteriorManager::PosteriorManager(const FeatureVector& prior_mean,
                                   const InformationMatrix& prior_covariance,
                                   NewtonOptions opts)
    : m_prior_mean(prior_mean), m_prior_cov(prior_covariance), m_opts(opts) {
    if (!prior_mean.allFinite() || !prior_covariance.allFinite()) {
        throw std::invalid_argument("PosteriorManager: prior must be finite");
    }
    if (m_opts.max_iterations <= 0 || !(m_opts.convergence_tolerance > 0.0)) {
        throw std::invalid_argument("PosteriorManager: max_iterations and convergence_tolerance must be > 0");
    }

    Eigen::LLT<InformationMatrix> llt(m_prior_cov);
    if (llt.info() != Eigen::Success) {
        throw std::invalid_argument("PosteriorManager: prior covariance must be positive definite");
    }
    m_prior_precision = llt.solve(InformationMatrix::Identity());

    m_post.mean = m_prior_mean;
    m_post.covariance = m_prior_cov;
}

double PosteriorManager::negative_log_likelihood(const FeatureVector& theta) const {
    double nll = 0.0;
    for (const auto& fn : m_terms) nll -= std::log(fn(theta));
    return nll;
}

double PosteriorManager::objective(const FeatureVector& theta) const {
    const FeatureVector d = theta - m_prior_mean;
    return negative_log_likelihood(theta) + 0.5 * d.dot(m_prior_precision * d);
}

FeatureVector PosteriorManager::gradient(const FeatureVector& theta) const {
    const double h = m_opts.gradient_step;

    FeatureVector g = m_prior_precision * (theta - m_prior_mean);
    if (m_terms.empty()) return g;

    for (int i = 0; i < kNumDimensions; ++i) {
        FeatureVector plus = theta;
        FeatureVector minus = theta;
        plus[i] += h;
        minus[i] -= h;
        g[i] += (negative_log_likelihood(plus) - negative_log_likelihood(minus)) / (2.0 * h);
    }

    return g;
}

InformationMatrix PosteriorManager::hessian(const FeatureVector& theta) const {
    const double h = m_opts.hessian_step;

    InformationMatrix hess = m_prior_precision;
    if (m_terms.empty()) return hess;

    for (int i = 0; i < kNumDimensions; ++i) {
        for (int j = i; j < kNumDimensions; ++j) {
            FeatureVector pp = theta, pm = theta, mp = theta, mm = theta;
            pp[i] += h; pp[j] += h;
            pm[i] += h; pm[j] -= h;
            mp[i] -= h; mp[j] += h;
            mm[i] -= h; mm[j] -= h;

            const double second = (negative_log_likelihood(pp) - negative_log_likelihood(pm)
                                 - negative_log_likelihood(mp) + negative_log_likelihood(mm)) / (4.0 * h * h);
            hess(i, j) += second;
            if (i != j) hess(j, i) += second;
        }
    }

    return hess;
}

bool PosteriorManager::solve_step(const InformationMatrix& hess,
                                  const FeatureVector& grad,
                                  FeatureVector& step,
                                  bool& regularized) const {
    InformationMatrix h = hess;
    double load = m_opts.covariance_regularization;

    for (int attempt = 0; attempt < 8; ++attempt) {
        Eigen::LDLT<InformationMatrix> ldlt(h);
        if (ldlt.info() == Eigen::Success && ldlt.isPositive() && (ldlt.vectorD().array() > 0.0).all()) {
            step = ldlt.solve(grad);
            if (step.allFinite()) return true;
        }
        h = hess + load * InformationMatrix::Identity();
        load *= 10.0;
        regularized = true;
    }

    return false;
}

bool PosteriorManager::covariance_at(const FeatureVector& theta, InformationMatrix& cov, bool& regularized) const {
    InformationMatrix h = hessian(theta);
    h = 0.5 * (h + h.transpose());

    Eigen::SelfAdjointEigenSolver<InformationMatrix> eig(h, Eigen::EigenvaluesOnly);
    if (eig.info() != Eigen::Success) return false;

    if (eig.eigenvalues().minCoeff() < m_opts.covariance_regularization) {
        h += m_opts.covariance_regularization * InformationMatrix::Identity();
        regularized = true;
    }

    Eigen::LDLT<InformationMatrix> ldlt(h);
    if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) return false;

    InformationMatrix inv = ldlt.solve(InformationMatrix::Identity());
    inv = 0.5 * (inv + inv.transpose());
    if (!inv.allFinite()) return false;

    Eigen::SelfAdjointEigenSolver<InformationMatrix> check(inv, Eigen::EigenvaluesOnly);
    if (check.info() != Eigen::Success || check.eigenvalues().minCoeff() <= 0.0) return false;

    cov = inv;
    return true;
}

void PosteriorManager::add_observation(LikelihoodFunction likelihood_fn, const Observation& observation) {
    if (!likelihood_fn) throw std::invalid_argument("PosteriorManager: empty likelihood function");
    m_terms.push_back(std::move(likelihood_fn));
    m_observations.push_back(observation);
}

PreferenceEstimate PosteriorManager::update(LikelihoodFunction likelihood_fn, const Observation& observation) {
    add_observation(std::move(likelihood_fn), observation);

    UpdateDiagnostics diag;

    FeatureVector theta = m_post.mean;
    double f = objective(theta);
    if (!std::isfinite(f)) {
        theta = m_prior_mean;
        f = objective(theta);
    }

    FeatureVector best = theta;
    double best_f = f;

    for (int it = 0; it < m_opts.max_iterations; ++it) {
        diag.iterations = it + 1;

        const FeatureVector g = gradient(theta);
        const InformationMatrix h = hessian(theta);

        FeatureVector step;
        if (!solve_step(h, g, step, diag.regularized)) {
            std::cerr << "PosteriorManager: Hessian not invertible at iteration " << diag.iterations
                      << " (" << observation.vignette_id << "); keeping best iterate\n";
            break;
        }

        // backtrack until the objective does not increase
        double t = 1.0;
        FeatureVector cand = theta - step;
        double fc = objective(cand);
        for (int k = 0; k < 30 && !(fc <= f); ++k) {
            t *= 0.5;
            cand = theta - t * step;
            fc = objective(cand);
        }

        if (!(fc <= f)) {
            diag.converged = step.norm() < m_opts.convergence_tolerance;
            break;
        }

        const double moved = (cand - theta).norm();
        theta = cand;
        f = fc;
        if (f <= best_f) {
            best = theta;
            best_f = f;
        }

        if (moved < m_opts.convergence_tolerance) {
            diag.converged = true;
            break;
        }
    }

    if (!diag.converged) {
        std::cerr << "PosteriorManager: Newton-Raphson did not converge in " << diag.iterations
                  << " iterations after " << observation.vignette_id
                  << "; using best iterate (objective " << best_f << ")\n";
    }

    InformationMatrix cov;
    if (covariance_at(best, cov, diag.regularized)) {
        m_post.covariance = cov;
    } else {
        diag.covariance_retained = true;
        std::cerr << "PosteriorManager: posterior Hessian near-singular after " << observation.vignette_id
                  << "; keeping previous covariance\n";
    }

    m_post.mean = best;
    diag.objective = best_f;
    m_last = diag;

    return m_post;
}

}  // namespace elicit
