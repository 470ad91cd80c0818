#pragma once

#include <optional>
#include <string>
#include <vector>

#include "elicit/AdaptiveConfig.hpp"
#include "elicit/Models.hpp"
#include "elicit/PosteriorManager.hpp"

namespace elicit {

// Per-session memory. `responses` is the event log; posterior and FIM are derived
// from it by the engine and cached here for persistence. A session restored
// from a snapshot without a log keeps its posterior in `log_prior`, and
// `responses` then holds only the answers given since.
struct SessionState {
    std::string session_id;
    std::vector<std::string> completed_vignettes;   // append-only, no duplicates
    PreferenceEstimate posterior;
    InformationMatrix fisher_information_matrix = InformationMatrix::Zero();
    int adaptive_vignettes_shown_count = 0;
    bool adaptive_phase_complete = false;           // false -> true only
    std::vector<Observation> responses;
    std::optional<PreferenceEstimate> log_prior;    // unset: replay starts at the configured prior

    static SessionState create(const std::string& session_id, const AdaptiveConfig& config);

    bool is_completed(const std::string& vignette_id) const;

    // false (and no change) when the id is already present
    bool mark_completed(const std::string& vignette_id);

    // nullptr when no response was recorded for this vignette
    const Observation* find_response(const std::string& vignette_id) const;

    void mark_adaptive_complete() { adaptive_phase_complete = true; }
};

}  // namespace elicit
