#include "elicit/StoppingCriterion.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace elicit {

const char* to_string(StoppingDecision d) {
    return d == StoppingDecision::Stop ? "STOP" : "CONTINUE";
}

StoppingCriterion::StoppingCriterion(StoppingThresholds thresholds) : m_thresholds(thresholds) {
    if (m_thresholds.min_vignettes < 1) {
        throw std::invalid_argument("StoppingCriterion: min_vignettes must be >= 1");
    }
    if (m_thresholds.max_vignettes < m_thresholds.min_vignettes) {
        throw std::invalid_argument("StoppingCriterion: max_vignettes must be >= min_vignettes");
    }
    if (!(m_thresholds.fim_det_threshold > 0.0) || !(m_thresholds.max_variance_threshold > 0.0)) {
        throw std::invalid_argument("StoppingCriterion: thresholds must be > 0");
    }
}

static StoppingResult make(bool cont, const std::string& reason) {
    StoppingResult r;
    r.should_continue = cont;
    r.decision = cont ? StoppingDecision::Continue : StoppingDecision::Stop;
    r.reason = reason;
    return r;
}

StoppingResult StoppingCriterion::should_continue(const PreferenceEstimate& posterior,
                                                  const InformationMatrix& fim,
                                                  int n_vignettes_shown) const {
    const StoppingThresholds& t = m_thresholds;

    if (n_vignettes_shown < t.min_vignettes) {
        std::ostringstream os;
        os << "minimum not reached (" << n_vignettes_shown << "/" << t.min_vignettes << " vignettes)";
        return make(true, os.str());
    }

    if (n_vignettes_shown >= t.max_vignettes) {
        std::ostringstream os;
        os << "maximum vignettes reached (" << n_vignettes_shown << "/" << t.max_vignettes << ")";
        return make(false, os.str());
    }

    const double det = fim.determinant();
    if (std::isfinite(det) && det > t.fim_det_threshold) {
        std::ostringstream os;
        os << "FIM determinant threshold exceeded (" << det << " > " << t.fim_det_threshold << ")";
        return make(false, os.str());
    }

    const double max_var = posterior.max_variance();
    if (max_var < t.max_variance_threshold) {
        std::ostringstream os;
        os << "posterior variance threshold reached (max " << max_var << " < " << t.max_variance_threshold << ")";
        return make(false, os.str());
    }

    std::ostringstream os;
    os << "uncertainty remains high (max variance " << max_var << ", FIM det " << det << ")";
    return make(true, os.str());
}

StoppingDiagnostics StoppingCriterion::diagnostics(const PreferenceEstimate& posterior,
                                                   const InformationMatrix& fim,
                                                   int n_vignettes_shown) const {
    StoppingDiagnostics d;
    const FeatureVector var = posterior.covariance.diagonal();

    d.n_vignettes_shown = n_vignettes_shown;
    d.fim_determinant = fim.determinant();
    d.max_variance = var.maxCoeff();
    d.min_variance = var.minCoeff();
    d.mean_variance = var.mean();
    d.uncertainty_per_dimension = var;
    d.meets_det_threshold = d.fim_determinant > m_thresholds.fim_det_threshold;
    d.meets_variance_threshold = d.max_variance < m_thresholds.max_variance_threshold;
    d.within_vignette_limits = n_vignettes_shown >= m_thresholds.min_vignettes
                            && n_vignettes_shown <= m_thresholds.max_vignettes;
    return d;
}

}  // namespace elicit
