#include "elicit/SessionState.hpp"

#include <algorithm>
#include <stdexcept>

namespace elicit {

SessionState SessionState::create(const std::string& session_id, const AdaptiveConfig& config) {
    if (session_id.empty()) throw std::invalid_argument("SessionState: session_id must be non-empty");

    SessionState s;
    s.session_id = session_id;
    s.posterior.mean = config.prior_mean;
    s.posterior.covariance = config.prior_covariance();
    s.fisher_information_matrix = InformationMatrix::Zero();
    return s;
}

bool SessionState::is_completed(const std::string& vignette_id) const {
    return std::find(completed_vignettes.begin(), completed_vignettes.end(), vignette_id) != completed_vignettes.end();
}

bool SessionState::mark_completed(const std::string& vignette_id) {
    if (is_completed(vignette_id)) return false;
    completed_vignettes.push_back(vignette_id);
    return true;
}

const Observation* SessionState::find_response(const std::string& vignette_id) const {
    for (const auto& r : responses) {
        if (r.vignette_id == vignette_id) return &r;
    }
    return nullptr;
}

}  // namespace elicit
