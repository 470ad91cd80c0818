#pragma once

#include <string>

#include "elicit/Models.hpp"

namespace elicit {

enum class StoppingDecision { Continue, Stop };

const char* to_string(StoppingDecision d);

struct StoppingResult {
    bool should_continue = true;
    StoppingDecision decision = StoppingDecision::Continue;
    std::string reason;
};

struct StoppingDiagnostics {
    int n_vignettes_shown = 0;
    double fim_determinant = 0.0;
    double max_variance = 0.0;
    double min_variance = 0.0;
    double mean_variance = 0.0;
    FeatureVector uncertainty_per_dimension = FeatureVector::Zero();
    bool meets_det_threshold = false;
    bool meets_variance_threshold = false;
    bool within_vignette_limits = false;
};

struct StoppingThresholds {
    int min_vignettes = 4;
    int max_vignettes = 12;
    double fim_det_threshold = 1e4;
    double max_variance_threshold = 0.65;
};

// Rules in precedence order: below minimum continues, at maximum stops,
// determinant or variance threshold stops, otherwise continue.
class StoppingCriterion {
public:
    explicit StoppingCriterion(StoppingThresholds thresholds = {});

    const StoppingThresholds& thresholds() const { return m_thresholds; }

    StoppingResult should_continue(const PreferenceEstimate& posterior,
                                   const InformationMatrix& fim,
                                   int n_vignettes_shown) const;

    StoppingDiagnostics diagnostics(const PreferenceEstimate& posterior,
                                    const InformationMatrix& fim,
                                    int n_vignettes_shown) const;

private:
    StoppingThresholds m_thresholds;
};

}  // namespace elicit
