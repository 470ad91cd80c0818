#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "elicit/AdaptiveConfig.hpp"
#include "elicit/DEfficiencyOptimizer.hpp"
#include "elicit/FisherInformation.hpp"
#include "elicit/Likelihood.hpp"
#include "elicit/Models.hpp"
#include "elicit/SessionState.hpp"
#include "elicit/StoppingCriterion.hpp"

namespace elicit {

enum class Phase { StaticBeginning, Adaptive, StaticEnd, Complete };

const char* to_string(Phase p);

enum class VignetteRole { StaticBeginning, Adaptive, StaticEnd };

// Drives a session through static beginning, adaptive D-optimal selection and
// static end. Holds no per-session state; every call works on the SessionState
// passed in, so one engine can serve many sessions concurrently.
class VignetteEngine {
public:
    VignetteEngine(AdaptiveConfig config, VignetteLibrary library);

    const AdaptiveConfig& config() const { return m_config; }
    const VignetteLibrary& library() const { return m_library; }
    const DEfficiencyOptimizer& optimizer() const { return m_optimizer; }

    // Adaptive vignettes left after dropping dominated pairs, library order.
    std::vector<const Vignette*> adaptive_candidates() const;

    // Next vignette to show, nullptr once every phase is exhausted. May set
    // state.adaptive_phase_complete when the stopping rule fires or the pool runs dry.
    // Throws std::logic_error if the chosen vignette was already completed.
    const Vignette* select_next_vignette(SessionState& state, const UserContext& user_context) const;

    // Append a response to the event log and rebuild posterior and FIM from it.
    // Repeating an identical response is a no-op; a conflicting repeat throws std::logic_error.
    StoppingResult record_response(SessionState& state,
                                   const std::string& vignette_id,
                                   const std::string& chosen_option_id) const;

    // Recompute posterior, FIM and adaptive count from state.responses, starting
    // at state.log_prior when set.
    void replay(SessionState& state) const;

    Phase current_phase(const SessionState& state) const;

    const Vignette* find_vignette(const std::string& vignette_id) const;
    bool is_adaptive(const std::string& vignette_id) const;

    StoppingDiagnostics stopping_diagnostics(const SessionState& state) const;

private:
    struct Slot {
        VignetteRole role;
        size_t index;
    };

    AdaptiveConfig m_config;
    VignetteLibrary m_library;

    LikelihoodCalculator m_likelihood;
    FisherInformationCalculator m_fim;
    DEfficiencyOptimizer m_optimizer;
    StoppingCriterion m_stopping;

    std::unordered_map<std::string, Slot> m_index;
    std::vector<size_t> m_adaptive_pool;   // indices into m_library.adaptive

    void index_vignettes(const std::vector<Vignette>& list, VignetteRole role);
    size_t count_completed(const SessionState& state, const std::vector<Vignette>& list) const;
    const Vignette* checked(const SessionState& state, const Vignette& v) const;
    std::vector<const Vignette*> remaining_candidates(const SessionState& state) const;
    bool static_beginning_done(const SessionState& state) const;
    void rebuild_estimates(SessionState& state) const;
    void refresh_fim(SessionState& state) const;
    PreferenceEstimate log_start(const SessionState& state) const;
};

}  // namespace elicit
