#include "elicit/Dominance.hpp"

#include <algorithm>
#include <cmath>

#include "elicit/FeatureEncoding.hpp"

namespace elicit {

bool features_dominate(const FeatureVector& fa, const FeatureVector& fb, double tol) {
    bool strictly_better = false;

    for (int i = 0; i < kNumDimensions; ++i) {
        const double diff = fa[i] - fb[i];
        if (diff < -tol) return false;
        if (diff > tol) strictly_better = true;
    }

    return strictly_better;
}

bool has_pairwise_dominance(const FeatureVector& fa, const FeatureVector& fb, double tol) {
    return features_dominate(fa, fb, tol) || features_dominate(fb, fa, tol);
}

bool has_pairwise_dominance(const JobProfile& a, const JobProfile& b) {
    return has_pairwise_dominance(encode_attributes(a), encode_attributes(b));
}

bool has_pairwise_dominance(const Vignette& v) {
    return has_pairwise_dominance(v.options[0].attributes, v.options[1].attributes);
}

bool has_quasi_dominance(const FeatureVector& fa, const FeatureVector& fb, int threshold) {
    int a_better = 0;
    int b_better = 0;

    for (int i = 0; i < kNumDimensions; ++i) {
        const double diff = fa[i] - fb[i];
        if (diff > kDominanceTolerance) ++a_better;
        if (diff < -kDominanceTolerance) ++b_better;
    }

    return a_better >= threshold || b_better >= threshold;
}

static double level_or_zero(const JobProfile& p, const char* key) {
    auto it = p.find(key);
    return it == p.end() ? 0.0 : it->second;
}

bool has_excessive_wage_gap(const JobProfile& a, const JobProfile& b, double max_ratio) {
    const double wa = level_or_zero(a, "wage");
    const double wb = level_or_zero(b, "wage");
    if (wa <= 0.0 || wb <= 0.0) return false;

    return std::max(wa, wb) / std::min(wa, wb) > max_ratio;
}

bool has_attribute_cancellation(const JobProfile& a, const JobProfile& b) {
    struct Group {
        int dim;
        std::vector<const char*> attrs;
    };
    static const std::vector<Group> groups = {
        {1, {"physical_demand", "remote_work", "commute_time"}},
        {3, {"flexibility", "commute_time"}},
        {5, {"task_variety", "social_interaction"}},
    };

    const FeatureVector fa = encode_attributes(a);
    const FeatureVector fb = encode_attributes(b);

    for (const auto& g : groups) {
        bool raw_differs = false;
        for (const char* key : g.attrs) {
            auto ia = a.find(key);
            auto ib = b.find(key);
            if (ia == a.end() || ib == b.end()) continue;
            if (ia->second != ib->second) raw_differs = true;
        }
        if (raw_differs && std::abs(fa[g.dim] - fb[g.dim]) <= kDominanceTolerance) return true;
    }

    return false;
}

bool encodes_identically(const JobProfile& a, const JobProfile& b) {
    return (encode_attributes(a) - encode_attributes(b)).cwiseAbs().maxCoeff() <= kDominanceTolerance;
}

std::vector<const Vignette*> filter_dominated(const std::vector<const Vignette*>& vignettes) {
    std::vector<const Vignette*> out;
    out.reserve(vignettes.size());
    for (const Vignette* v : vignettes) {
        if (v && !has_pairwise_dominance(*v)) out.push_back(v);
    }
    return out;
}

}  // namespace elicit
