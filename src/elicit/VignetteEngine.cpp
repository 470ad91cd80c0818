#include "elicit/VignetteEngine.hpp"

#include <iostream>
#include <stdexcept>

#include "elicit/Dominance.hpp"
#include "elicit/PosteriorManager.hpp"

namespace elicit {

const char* to_string(Phase p) {
    switch (p) {
        case Phase::StaticBeginning: return "static_beginning";
        case Phase::Adaptive: return "adaptive";
        case Phase::StaticEnd: return "static_end";
        case Phase::Complete: return "complete";
        default: return "unknown";
    }
}

static AdaptiveConfig validated(AdaptiveConfig config) {
    config.validate();
    return config;
}

static StoppingResult phase_result(bool cont, const std::string& reason) {
    StoppingResult r;
    r.should_continue = cont;
    r.decision = cont ? StoppingDecision::Continue : StoppingDecision::Stop;
    r.reason = reason;
    return r;
}

VignetteEngine::VignetteEngine(AdaptiveConfig config, VignetteLibrary library)
    : m_config(validated(std::move(config))),
      m_library(std::move(library)),
      m_likelihood(m_config.temperature),
      m_fim(m_likelihood, m_config.fim_regularization),
      m_optimizer(m_fim, m_config.bayesian_selection ? SelectionMode::Bayesian : SelectionMode::DOptimal),
      m_stopping(m_config.stopping_thresholds()) {
    index_vignettes(m_library.static_beginning, VignetteRole::StaticBeginning);
    index_vignettes(m_library.adaptive, VignetteRole::Adaptive);
    index_vignettes(m_library.static_end, VignetteRole::StaticEnd);

    size_t dropped = 0;
    for (size_t i = 0; i < m_library.adaptive.size(); ++i) {
        if (has_pairwise_dominance(m_library.adaptive[i])) {
            ++dropped;
            continue;
        }
        m_adaptive_pool.push_back(i);
    }

    if (dropped > 0) {
        std::cerr << "VignetteEngine: removed " << dropped << " dominated adaptive candidate(s), "
                  << m_adaptive_pool.size() << " remain\n";
    }
}

void VignetteEngine::index_vignettes(const std::vector<Vignette>& list, VignetteRole role) {
    for (size_t i = 0; i < list.size(); ++i) {
        const Vignette& v = list[i];
        if (v.vignette_id.empty()) {
            throw std::invalid_argument("VignetteEngine: vignette with empty id");
        }
        if (v.options[0].option_id.empty() || v.options[0].option_id == v.options[1].option_id) {
            throw std::invalid_argument("VignetteEngine: vignette " + v.vignette_id + " needs two distinct option ids");
        }
        if (encodes_identically(v.options[0].attributes, v.options[1].attributes)) {
            throw std::invalid_argument("VignetteEngine: options of vignette " + v.vignette_id +
                                        " encode to the same feature vector");
        }
        if (!m_index.emplace(v.vignette_id, Slot{role, i}).second) {
            throw std::invalid_argument("VignetteEngine: duplicate vignette id " + v.vignette_id);
        }
    }
}

const Vignette* VignetteEngine::find_vignette(const std::string& vignette_id) const {
    auto it = m_index.find(vignette_id);
    if (it == m_index.end()) return nullptr;

    switch (it->second.role) {
        case VignetteRole::StaticBeginning: return &m_library.static_beginning[it->second.index];
        case VignetteRole::Adaptive: return &m_library.adaptive[it->second.index];
        case VignetteRole::StaticEnd: return &m_library.static_end[it->second.index];
    }
    return nullptr;
}

bool VignetteEngine::is_adaptive(const std::string& vignette_id) const {
    auto it = m_index.find(vignette_id);
    return it != m_index.end() && it->second.role == VignetteRole::Adaptive;
}

std::vector<const Vignette*> VignetteEngine::adaptive_candidates() const {
    std::vector<const Vignette*> out;
    out.reserve(m_adaptive_pool.size());
    for (size_t i : m_adaptive_pool) out.push_back(&m_library.adaptive[i]);
    return out;
}

size_t VignetteEngine::count_completed(const SessionState& state, const std::vector<Vignette>& list) const {
    size_t n = 0;
    for (const auto& v : list) {
        if (state.is_completed(v.vignette_id)) ++n;
    }
    return n;
}

bool VignetteEngine::static_beginning_done(const SessionState& state) const {
    return count_completed(state, m_library.static_beginning) >= m_library.static_beginning.size();
}

std::vector<const Vignette*> VignetteEngine::remaining_candidates(const SessionState& state) const {
    std::vector<const Vignette*> out;
    for (size_t i : m_adaptive_pool) {
        const Vignette& v = m_library.adaptive[i];
        if (!state.is_completed(v.vignette_id)) out.push_back(&v);
    }
    return out;
}

const Vignette* VignetteEngine::checked(const SessionState& state, const Vignette& v) const {
    if (state.is_completed(v.vignette_id)) {
        throw std::logic_error("VignetteEngine: selected vignette " + v.vignette_id +
                               " is already completed in session " + state.session_id);
    }
    return &v;
}

const Vignette* VignetteEngine::select_next_vignette(SessionState& state, const UserContext& /*user_context*/) const {
    const size_t begin_done = count_completed(state, m_library.static_beginning);
    if (begin_done < m_library.static_beginning.size()) {
        return checked(state, m_library.static_beginning[begin_done]);
    }

    if (m_config.enabled && !state.adaptive_phase_complete) {
        const StoppingResult stop = m_stopping.should_continue(
            state.posterior, state.fisher_information_matrix, static_cast<int>(state.completed_vignettes.size()));

        if (!stop.should_continue) {
            state.mark_adaptive_complete();
            std::cerr << "VignetteEngine: session " << state.session_id << " adaptive phase stopped: "
                      << stop.reason << "\n";
        } else {
            const auto candidates = remaining_candidates(state);
            const CandidateSelection sel = candidates.empty()
                ? CandidateSelection{}
                : m_optimizer.select_best_candidate(candidates, state.fisher_information_matrix, state.posterior);

            if (sel.vignette) return checked(state, *sel.vignette);

            state.mark_adaptive_complete();
            std::cerr << "VignetteEngine: session " << state.session_id
                      << " adaptive candidate pool exhausted; moving to static end\n";
        }
    }

    const size_t end_done = count_completed(state, m_library.static_end);
    if (end_done < m_library.static_end.size()) {
        return checked(state, m_library.static_end[end_done]);
    }

    return nullptr;
}

void VignetteEngine::rebuild_estimates(SessionState& state) const {
    const PreferenceEstimate start = log_start(state);
    PosteriorManager manager(start.mean, start.covariance, m_config.newton_options());

    const PreferenceEstimate previous = state.posterior;

    for (size_t i = 0; i < state.responses.size(); ++i) {
        const Observation& obs = state.responses[i];
        const Vignette* v = find_vignette(obs.vignette_id);
        if (!v) {
            throw std::invalid_argument("VignetteEngine: response for unknown vignette " + obs.vignette_id);
        }

        auto fn = m_likelihood.create_likelihood_function(*v, obs.chosen_option_id);
        if (i + 1 < state.responses.size()) {
            manager.add_observation(std::move(fn), obs);
        } else {
            manager.update(std::move(fn), obs);
        }
    }

    state.posterior = manager.posterior();
    if (manager.last_update().covariance_retained) {
        state.posterior.covariance = previous.covariance;
    }

    refresh_fim(state);
}

PreferenceEstimate VignetteEngine::log_start(const SessionState& state) const {
    if (state.log_prior) return *state.log_prior;

    PreferenceEstimate prior;
    prior.mean = m_config.prior_mean;
    prior.covariance = m_config.prior_covariance();
    return prior;
}

void VignetteEngine::refresh_fim(SessionState& state) const {
    std::vector<const Vignette*> completed;
    completed.reserve(state.completed_vignettes.size());
    for (const auto& id : state.completed_vignettes) {
        const Vignette* v = find_vignette(id);
        if (!v) throw std::invalid_argument("VignetteEngine: completed vignette unknown to library: " + id);
        completed.push_back(v);
    }

    state.fisher_information_matrix = m_fim.compute_cumulative_fim(completed, state.posterior.mean);
}

void VignetteEngine::replay(SessionState& state) const {
    for (const auto& obs : state.responses) {
        if (!state.is_completed(obs.vignette_id)) state.mark_completed(obs.vignette_id);
    }

    int adaptive = 0;
    for (const auto& id : state.completed_vignettes) {
        if (is_adaptive(id)) ++adaptive;
    }
    state.adaptive_vignettes_shown_count = adaptive;

    if (state.responses.empty()) {
        state.posterior = log_start(state);
        refresh_fim(state);
        return;
    }

    rebuild_estimates(state);
}

StoppingResult VignetteEngine::record_response(SessionState& state,
                                               const std::string& vignette_id,
                                               const std::string& chosen_option_id) const {
    const Vignette* v = find_vignette(vignette_id);
    if (!v) {
        throw std::invalid_argument("VignetteEngine: unknown vignette " + vignette_id);
    }
    if (!v->find_option(chosen_option_id)) {
        throw std::invalid_argument("VignetteEngine: vignette " + vignette_id + " has no option " + chosen_option_id);
    }

    const Observation* previous = state.find_response(vignette_id);
    const bool repeat = previous != nullptr;
    if (repeat && previous->chosen_option_id != chosen_option_id) {
        throw std::logic_error("VignetteEngine: conflicting response for " + vignette_id + " (" +
                               previous->chosen_option_id + " already recorded, got " + chosen_option_id + ")");
    }
    if (!repeat && state.is_completed(vignette_id)) {
        throw std::logic_error("VignetteEngine: vignette " + vignette_id + " completed without a recorded response");
    }

    if (!repeat) {
        state.responses.push_back(Observation{vignette_id, chosen_option_id});
        state.mark_completed(vignette_id);
        if (is_adaptive(vignette_id)) ++state.adaptive_vignettes_shown_count;

        rebuild_estimates(state);
    }

    if (!m_config.enabled) {
        return phase_result(true, "adaptive phase disabled");
    }
    if (state.adaptive_phase_complete) {
        return phase_result(false, "adaptive phase complete");
    }
    if (!static_beginning_done(state)) {
        return phase_result(true, "static beginning in progress");
    }

    const StoppingResult stop = m_stopping.should_continue(
        state.posterior, state.fisher_information_matrix, static_cast<int>(state.completed_vignettes.size()));

    if (!stop.should_continue) {
        state.mark_adaptive_complete();
        std::cerr << "VignetteEngine: session " << state.session_id << " adaptive phase stopped: "
                  << stop.reason << "\n";
    }

    return stop;
}

Phase VignetteEngine::current_phase(const SessionState& state) const {
    if (!static_beginning_done(state)) return Phase::StaticBeginning;

    if (m_config.enabled && !state.adaptive_phase_complete && !remaining_candidates(state).empty()) {
        return Phase::Adaptive;
    }

    if (count_completed(state, m_library.static_end) < m_library.static_end.size()) return Phase::StaticEnd;

    return Phase::Complete;
}

StoppingDiagnostics VignetteEngine::stopping_diagnostics(const SessionState& state) const {
    return m_stopping.diagnostics(state.posterior, state.fisher_information_matrix,
                                  static_cast<int>(state.completed_vignettes.size()));
}

}  // namespace elicit
