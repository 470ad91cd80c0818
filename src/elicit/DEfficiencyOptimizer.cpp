#include "elicit/DEfficiencyOptimizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "elicit/Dominance.hpp"

namespace elicit {

const char* to_string(SelectionCriterion c) {
    switch (c) {
        case SelectionCriterion::DOptimal: return "d_optimal";
        case SelectionCriterion::BayesianDOptimal: return "bayesian_d_optimal";
        case SelectionCriterion::TraceFallback: return "trace_fallback";
        default: return "unknown";
    }
}

DEfficiencyOptimizer::DEfficiencyOptimizer(FisherInformationCalculator fim, SelectionMode mode)
    : m_fim(fim), m_mode(mode) {}

CandidateSelection DEfficiencyOptimizer::select_best_candidate(const std::vector<const Vignette*>& candidates,
                                                               const InformationMatrix& current_fim,
                                                               const FeatureVector& theta) const {
    CandidateSelection out;

    const auto pool = filter_dominated(candidates);
    out.candidates_considered = static_cast<int>(pool.size());
    if (pool.empty()) return out;

    std::vector<InformationMatrix> updated;
    updated.reserve(pool.size());

    const Vignette* best = nullptr;
    double best_det = 0.0;

    for (const Vignette* v : pool) {
        updated.push_back(current_fim + m_fim.compute_fim(*v, theta));
        const double det = updated.back().determinant();
        if (!std::isfinite(det) || det <= 0.0) continue;

        if (!best || det > best_det) {
            best = v;
            best_det = det;
        }
    }

    if (best) {
        out.vignette = best;
        out.criterion = SelectionCriterion::DOptimal;
        out.score = best_det;
        return out;
    }

    return trace_fallback(pool, updated);
}

CandidateSelection DEfficiencyOptimizer::select_best_candidate(const std::vector<const Vignette*>& candidates,
                                                               const InformationMatrix& current_fim,
                                                               const PreferenceEstimate& posterior) const {
    if (m_mode == SelectionMode::DOptimal) {
        return select_best_candidate(candidates, current_fim, posterior.mean);
    }

    CandidateSelection out;

    const auto pool = filter_dominated(candidates);
    out.candidates_considered = static_cast<int>(pool.size());
    if (pool.empty()) return out;

    std::vector<InformationMatrix> updated;
    updated.reserve(pool.size());

    const Vignette* best = nullptr;
    double best_score = 0.0;

    for (const Vignette* v : pool) {
        const ExpectedInformation e =
            m_fim.compute_bayesian_expected_fim(*v, posterior.mean, posterior.covariance, current_fim);
        updated.push_back(e.fim);

        const double det = e.fim.determinant();
        if (!std::isfinite(det) || det <= 0.0 || !std::isfinite(e.determinant_increase)) continue;

        if (!best || e.determinant_increase > best_score) {
            best = v;
            best_score = e.determinant_increase;
        }
    }

    if (best) {
        out.vignette = best;
        out.criterion = SelectionCriterion::BayesianDOptimal;
        out.score = best_score;
        return out;
    }

    return trace_fallback(pool, updated);
}

// every determinant degenerate: maximise total information instead
CandidateSelection DEfficiencyOptimizer::trace_fallback(const std::vector<const Vignette*>& pool,
                                                        const std::vector<InformationMatrix>& updated) {
    size_t best_idx = 0;
    double best_trace = updated[0].trace();
    for (size_t i = 1; i < pool.size(); ++i) {
        const double tr = updated[i].trace();
        if (tr > best_trace) {
            best_idx = i;
            best_trace = tr;
        }
    }

    std::cerr << "DEfficiencyOptimizer: all " << pool.size()
              << " candidate determinants non-positive; selecting by trace ("
              << pool[best_idx]->vignette_id << ")\n";

    CandidateSelection out;
    out.vignette = pool[best_idx];
    out.criterion = SelectionCriterion::TraceFallback;
    out.score = best_trace;
    out.candidates_considered = static_cast<int>(pool.size());
    return out;
}

std::vector<RankedCandidate> DEfficiencyOptimizer::rank_candidates(const std::vector<const Vignette*>& candidates,
                                                                   const InformationMatrix& current_fim,
                                                                   const FeatureVector& theta) const {
    std::vector<RankedCandidate> ranked;
    for (const Vignette* v : filter_dominated(candidates)) {
        const InformationMatrix m = current_fim + m_fim.compute_fim(*v, theta);
        ranked.push_back({v, m.determinant()});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
        return a.determinant > b.determinant;
    });
    return ranked;
}

}  // namespace elicit
