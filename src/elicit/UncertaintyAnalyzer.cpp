#include "elicit/UncertaintyAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace elicit {

UncertaintyAnalyzer::UncertaintyAnalyzer(double uncertainty_threshold) : m_threshold(uncertainty_threshold) {
    if (!(uncertainty_threshold > 0.0) || !std::isfinite(uncertainty_threshold)) {
        throw std::invalid_argument("UncertaintyAnalyzer: uncertainty_threshold must be > 0");
    }
}

std::vector<DimensionUncertainty> UncertaintyAnalyzer::uncertainty_scores(const PreferenceEstimate& posterior) const {
    std::vector<DimensionUncertainty> out;
    out.reserve(kNumDimensions);
    for (int i = 0; i < kNumDimensions; ++i) {
        out.push_back({kDimensionNames[i], posterior.variance(i)});
    }
    return out;
}

std::vector<DimensionUncertainty> UncertaintyAnalyzer::uncertain_dimensions(const PreferenceEstimate& posterior,
                                                                            int top_k) const {
    auto out = uncertainty_scores(posterior);
    std::stable_sort(out.begin(), out.end(), [](const DimensionUncertainty& a, const DimensionUncertainty& b) {
        return a.variance > b.variance;
    });

    if (top_k >= 0 && static_cast<size_t>(top_k) < out.size()) out.resize(static_cast<size_t>(top_k));
    return out;
}

std::vector<std::string> UncertaintyAnalyzer::high_uncertainty_dimensions(const PreferenceEstimate& posterior) const {
    std::vector<std::string> out;
    for (int i = 0; i < kNumDimensions; ++i) {
        if (posterior.variance(i) > m_threshold) out.push_back(kDimensionNames[i]);
    }
    return out;
}

double UncertaintyAnalyzer::global_uncertainty(const PreferenceEstimate& posterior) const {
    return posterior.covariance.diagonal().mean();
}

std::vector<DimensionCorrelation> UncertaintyAnalyzer::dimension_correlations(const PreferenceEstimate& posterior) const {
    std::vector<DimensionCorrelation> out;
    const InformationMatrix& cov = posterior.covariance;

    for (int i = 0; i < kNumDimensions; ++i) {
        for (int j = i + 1; j < kNumDimensions; ++j) {
            const double denom = std::sqrt(cov(i, i) * cov(j, j));
            const double corr = (cov(i, i) > 0.0 && cov(j, j) > 0.0 && denom > 0.0) ? cov(i, j) / denom : 0.0;
            out.push_back({kDimensionNames[i], kDimensionNames[j], corr});
        }
    }
    return out;
}

UncertaintyReport UncertaintyAnalyzer::report(const PreferenceEstimate& posterior, int top_k) const {
    UncertaintyReport r;
    r.global_uncertainty = global_uncertainty(posterior);
    r.uncertainty_threshold = m_threshold;
    r.scores = uncertainty_scores(posterior);
    r.most_uncertain = uncertain_dimensions(posterior, top_k);
    r.high_uncertainty = high_uncertainty_dimensions(posterior);
    r.correlations = dimension_correlations(posterior);
    return r;
}

static nlohmann::json dims_to_json(const std::vector<DimensionUncertainty>& dims) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : dims) {
        arr.push_back({{"dimension", d.dimension}, {"variance", d.variance}});
    }
    return arr;
}

nlohmann::json UncertaintyReport::to_json() const {
    nlohmann::json j;

    j["global_uncertainty"] = global_uncertainty;
    j["uncertainty_threshold"] = uncertainty_threshold;
    j["uncertainty_scores"] = dims_to_json(scores);
    j["most_uncertain_dimensions"] = dims_to_json(most_uncertain);
    j["high_uncertainty_dimensions"] = high_uncertainty;

    nlohmann::json corr = nlohmann::json::array();
    for (const auto& c : correlations) {
        corr.push_back({{"first", c.first}, {"second", c.second}, {"correlation", c.correlation}});
    }
    j["dimension_correlations"] = corr;

    return j;
}

}  // namespace elicit
