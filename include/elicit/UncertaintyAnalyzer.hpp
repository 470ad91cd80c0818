// include/elicit/UncertaintyAnalyzer.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "elicit/Models.hpp"
#include "nlohmann/json.hpp"

namespace elicit {

struct DimensionUncertainty {
    std::string dimension;
    double variance = 0.0;
};

struct DimensionCorrelation {
    std::string first;
    std::string second;
    double correlation = 0.0;
};

struct UncertaintyReport {
    double global_uncertainty = 0.0;
    double uncertainty_threshold = 0.0;
    std::vector<DimensionUncertainty> scores;          // dimension order
    std::vector<DimensionUncertainty> most_uncertain;  // variance desc
    std::vector<std::string> high_uncertainty;         // variance > threshold
    std::vector<DimensionCorrelation> correlations;

    nlohmann::json to_json() const;
};

class UncertaintyAnalyzer {
public:
    explicit UncertaintyAnalyzer(double uncertainty_threshold = 0.3);

    double threshold() const { return m_threshold; }

    std::vector<DimensionUncertainty> uncertainty_scores(const PreferenceEstimate& posterior) const;

    // Highest variance first, ties keep dimension order.
    std::vector<DimensionUncertainty> uncertain_dimensions(const PreferenceEstimate& posterior, int top_k) const;

    std::vector<std::string> high_uncertainty_dimensions(const PreferenceEstimate& posterior) const;

    double global_uncertainty(const PreferenceEstimate& posterior) const;

    // Upper triangle of the correlation matrix; 0 where a variance is not positive.
    std::vector<DimensionCorrelation> dimension_correlations(const PreferenceEstimate& posterior) const;

    UncertaintyReport report(const PreferenceEstimate& posterior, int top_k = 3) const;

private:
    double m_threshold = 0.3;
};

}  // namespace elicit
