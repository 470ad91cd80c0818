#pragma once

#include <vector>

#include "elicit/FisherInformation.hpp"
#include "elicit/Models.hpp"

namespace elicit {

enum class SelectionCriterion { DOptimal, BayesianDOptimal, TraceFallback };

const char* to_string(SelectionCriterion c);

// DOptimal ranks by det(current + fim); Bayesian ranks by the determinant gain
// weighted with the posterior variance along each candidate's contrast.
enum class SelectionMode { DOptimal, Bayesian };

struct CandidateSelection {
    const Vignette* vignette = nullptr;   // nullptr when nothing is selectable
    SelectionCriterion criterion = SelectionCriterion::DOptimal;
    double score = 0.0;                   // det, weighted gain, or trace on fallback
    int candidates_considered = 0;        // after dominance filtering
};

struct RankedCandidate {
    const Vignette* vignette = nullptr;
    double determinant = 0.0;
};

// Greedy D-optimal selection: maximise det(current + fim(candidate)).
class DEfficiencyOptimizer {
public:
    explicit DEfficiencyOptimizer(FisherInformationCalculator fim = FisherInformationCalculator(),
                                  SelectionMode mode = SelectionMode::DOptimal);

    const FisherInformationCalculator& fisher() const { return m_fim; }
    SelectionMode mode() const { return m_mode; }

    // Dominated candidates are excluded; ties go to the earliest candidate.
    // Falls back to the maximum trace when no determinant is positive.
    CandidateSelection select_best_candidate(const std::vector<const Vignette*>& candidates,
                                             const InformationMatrix& current_fim,
                                             const FeatureVector& theta) const;

    // Selection in the configured mode; DOptimal uses only posterior.mean.
    CandidateSelection select_best_candidate(const std::vector<const Vignette*>& candidates,
                                             const InformationMatrix& current_fim,
                                             const PreferenceEstimate& posterior) const;

    std::vector<RankedCandidate> rank_candidates(const std::vector<const Vignette*>& candidates,
                                                 const InformationMatrix& current_fim,
                                                 const FeatureVector& theta) const;

private:
    FisherInformationCalculator m_fim;
    SelectionMode m_mode = SelectionMode::DOptimal;

    static CandidateSelection trace_fallback(const std::vector<const Vignette*>& pool,
                                             const std::vector<InformationMatrix>& updated);
};

}  // namespace elicit
