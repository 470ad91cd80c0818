#pragma once

#include <string>
#include <vector>

#include "elicit/FisherInformation.hpp"
#include "elicit/Models.hpp"
#include "elicit/ProfileGenerator.hpp"

namespace elicit {

struct OfflineDesignOptions {
    FeatureVector prior_mean = FeatureVector::Constant(0.5);
    double prior_variance = 0.5;
    double temperature = 1.0;
    int quasi_dominance_threshold = 5;
    double max_wage_ratio = 1.67;
};

struct StaticDesign {
    std::vector<ProfilePair> beginning;
    std::vector<ProfilePair> end;
    InformationMatrix fim = InformationMatrix::Zero();   // prior FIM plus selected pairs
};

struct DesignStatistics {
    size_t num_vignettes = 0;
    double determinant = 0.0;
    double d_efficiency = 0.0;
    FeatureVector information_per_dimension = FeatureVector::Zero();
};

// Offline construction of the static vignettes and the adaptive candidate library.
class OfflineDesigner {
public:
    explicit OfflineDesigner(OfflineDesignOptions opts = {});

    const OfflineDesignOptions& options() const { return m_opts; }

    // Not dominated, not quasi-dominated, wage gap within bounds.
    bool passes_static_filters(const ProfilePair& pair) const;

    // Static filters plus no attribute cancellation.
    bool passes_library_filters(const ProfilePair& pair) const;

    InformationMatrix pair_fim(const ProfilePair& pair) const;

    // Greedy D-optimal selection starting from the prior FIM; the first
    // num_beginning picks open the session, the rest close it.
    StaticDesign select_static_design(const std::vector<ProfilePair>& pairs,
                                      int num_static = 6,
                                      int num_beginning = 4) const;

    // Greedy (1 - w) * det(fim + 1e-8 I) + w * min(1 - |cos|) selection.
    std::vector<ProfilePair> build_adaptive_library(const std::vector<ProfilePair>& pairs,
                                                    int num_library = 40,
                                                    const std::vector<ProfilePair>& excluded = {},
                                                    double diversity_weight = 0.3) const;

    DesignStatistics statistics(const std::vector<ProfilePair>& pairs) const;

    // Mean pairwise 1 - |cos| of the feature differences; 0 for fewer than two pairs.
    static double library_diversity(const std::vector<ProfilePair>& pairs);

private:
    OfflineDesignOptions m_opts;
    FisherInformationCalculator m_fim;
};

// Turns generated profile pairs into presentable vignettes.
class VignetteConverter {
public:
    explicit VignetteConverter(const ProfileGenerator& generator);

    // Category of the attribute with the largest range-normalised difference;
    // "mixed" when nothing differs by at least 0.1.
    std::string infer_category(const JobProfile& a, const JobProfile& b) const;

    static std::string scenario_text(const std::string& category);

    std::string option_title(const std::string& option_id, const JobProfile& profile) const;

    Vignette convert(const ProfilePair& pair, const std::string& vignette_id) const;

    // ids static_begin_001.., static_end_001.., adaptive_001..
    VignetteLibrary convert_library(const StaticDesign& design, const std::vector<ProfilePair>& adaptive) const;

private:
    const ProfileGenerator& m_generator;
};

}  // namespace elicit
