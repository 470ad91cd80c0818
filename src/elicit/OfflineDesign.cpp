#include "elicit/OfflineDesign.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>
#include <stdexcept>

#include "elicit/Dominance.hpp"
#include "elicit/FeatureEncoding.hpp"

namespace elicit {

static bool same_pair(const ProfilePair& x, const ProfilePair& y) {
    return (x.first == y.first && x.second == y.second) || (x.first == y.second && x.second == y.first);
}

static bool contains_pair(const std::vector<ProfilePair>& list, const ProfilePair& p) {
    for (const auto& q : list) {
        if (same_pair(q, p)) return true;
    }
    return false;
}

static FeatureVector pair_difference(const ProfilePair& p) {
    return encode_attributes(p.first) - encode_attributes(p.second);
}

static double orthogonality(const FeatureVector& x, const FeatureVector& y) {
    const double cos = x.dot(y) / (x.norm() * y.norm() + 1e-10);
    return 1.0 - std::abs(cos);
}

OfflineDesigner::OfflineDesigner(OfflineDesignOptions opts)
    : m_opts(opts), m_fim(LikelihoodCalculator(opts.temperature), 0.0) {
    if (!(m_opts.prior_variance > 0.0)) {
        throw std::invalid_argument("OfflineDesigner: prior_variance must be > 0");
    }
}

bool OfflineDesigner::passes_static_filters(const ProfilePair& pair) const {
    const FeatureVector fa = encode_attributes(pair.first);
    const FeatureVector fb = encode_attributes(pair.second);

    if ((fa - fb).cwiseAbs().maxCoeff() <= kDominanceTolerance) return false;
    if (has_pairwise_dominance(fa, fb)) return false;
    if (has_quasi_dominance(fa, fb, m_opts.quasi_dominance_threshold)) return false;
    if (has_excessive_wage_gap(pair.first, pair.second, m_opts.max_wage_ratio)) return false;
    return true;
}

bool OfflineDesigner::passes_library_filters(const ProfilePair& pair) const {
    return passes_static_filters(pair) && !has_attribute_cancellation(pair.first, pair.second);
}

InformationMatrix OfflineDesigner::pair_fim(const ProfilePair& pair) const {
    return m_fim.compute_fim(encode_attributes(pair.first), encode_attributes(pair.second), m_opts.prior_mean);
}

StaticDesign OfflineDesigner::select_static_design(const std::vector<ProfilePair>& pairs,
                                                   int num_static,
                                                   int num_beginning) const {
    if (num_static < 0 || num_beginning < 0 || num_beginning > num_static) {
        throw std::invalid_argument("OfflineDesigner: need 0 <= num_beginning <= num_static");
    }

    std::vector<size_t> eligible;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (passes_static_filters(pairs[i])) eligible.push_back(i);
    }

    std::cerr << "OfflineDesigner: " << eligible.size() << " of " << pairs.size()
              << " candidate pairs pass static filters\n";

    StaticDesign out;
    out.fim = InformationMatrix::Identity() / m_opts.prior_variance;

    std::vector<bool> used(pairs.size(), false);
    std::vector<ProfilePair> chosen;

    for (int step = 0; step < num_static; ++step) {
        long best = -1;
        double best_det = 0.0;
        InformationMatrix best_fim;

        for (size_t i : eligible) {
            if (used[i] || contains_pair(chosen, pairs[i])) continue;
            const InformationMatrix updated = out.fim + pair_fim(pairs[i]);
            const double det = updated.determinant();
            if (!std::isfinite(det)) continue;
            if (best < 0 || det > best_det) {
                best = static_cast<long>(i);
                best_det = det;
                best_fim = updated;
            }
        }

        if (best < 0) {
            std::cerr << "OfflineDesigner: only " << chosen.size() << " static pairs available, wanted "
                      << num_static << "\n";
            break;
        }

        used[static_cast<size_t>(best)] = true;
        chosen.push_back(pairs[static_cast<size_t>(best)]);
        out.fim = best_fim;
    }

    for (size_t i = 0; i < chosen.size(); ++i) {
        if (i < static_cast<size_t>(num_beginning)) out.beginning.push_back(chosen[i]);
        else out.end.push_back(chosen[i]);
    }

    std::cerr << "OfflineDesigner: static design det " << out.fim.determinant() << " ("
              << out.beginning.size() << " beginning, " << out.end.size() << " end)\n";

    return out;
}

std::vector<ProfilePair> OfflineDesigner::build_adaptive_library(const std::vector<ProfilePair>& pairs,
                                                                 int num_library,
                                                                 const std::vector<ProfilePair>& excluded,
                                                                 double diversity_weight) const {
    if (num_library < 0) throw std::invalid_argument("OfflineDesigner: num_library must be >= 0");
    if (!(diversity_weight >= 0.0 && diversity_weight <= 1.0)) {
        throw std::invalid_argument("OfflineDesigner: diversity_weight must be in [0, 1]");
    }

    std::vector<size_t> eligible;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (passes_library_filters(pairs[i]) && !contains_pair(excluded, pairs[i])) eligible.push_back(i);
    }

    std::vector<ProfilePair> library;
    std::vector<FeatureVector> diffs;
    std::vector<bool> used(pairs.size(), false);

    while (library.size() < static_cast<size_t>(num_library)) {
        long best = -1;
        double best_score = 0.0;

        for (size_t i : eligible) {
            if (used[i] || contains_pair(library, pairs[i])) continue;

            const InformationMatrix fim = pair_fim(pairs[i]) + 1e-8 * InformationMatrix::Identity();
            const double informativeness = fim.determinant();

            const FeatureVector d = pair_difference(pairs[i]);
            double diversity = 1.0;
            for (const auto& prev : diffs) diversity = std::min(diversity, orthogonality(d, prev));

            const double score = (1.0 - diversity_weight) * informativeness + diversity_weight * diversity;
            if (best < 0 || score > best_score) {
                best = static_cast<long>(i);
                best_score = score;
            }
        }

        if (best < 0) break;

        used[static_cast<size_t>(best)] = true;
        library.push_back(pairs[static_cast<size_t>(best)]);
        diffs.push_back(pair_difference(library.back()));
    }

    if (library.size() < static_cast<size_t>(num_library)) {
        std::cerr << "OfflineDesigner: adaptive library has " << library.size() << " of " << num_library
                  << " requested vignettes\n";
    }

    return library;
}

DesignStatistics OfflineDesigner::statistics(const std::vector<ProfilePair>& pairs) const {
    InformationMatrix fim = InformationMatrix::Identity() / m_opts.prior_variance;
    for (const auto& p : pairs) fim += pair_fim(p);

    DesignStatistics s;
    s.num_vignettes = pairs.size();
    s.determinant = fim.determinant();
    s.d_efficiency = FisherInformationCalculator::d_efficiency(fim);
    s.information_per_dimension = FisherInformationCalculator::information_per_dimension(fim);
    return s;
}

double OfflineDesigner::library_diversity(const std::vector<ProfilePair>& pairs) {
    if (pairs.size() < 2) return 0.0;

    std::vector<FeatureVector> diffs;
    for (const auto& p : pairs) diffs.push_back(pair_difference(p));

    double total = 0.0;
    size_t n = 0;
    for (size_t i = 0; i < diffs.size(); ++i) {
        for (size_t j = i + 1; j < diffs.size(); ++j) {
            total += orthogonality(diffs[i], diffs[j]);
            ++n;
        }
    }
    return total / static_cast<double>(n);
}

// ---------------------------------------------------------------------------

static const std::map<std::string, std::string>& attribute_categories() {
    static const std::map<std::string, std::string> m = {
        {"wage", "financial"},
        {"physical_demand", "work_environment"},
        {"commute_time", "work_environment"},
        {"remote_work", "work_environment"},
        {"flexibility", "work_life_balance"},
        {"job_security", "job_security"},
        {"career_growth", "career_advancement"},
        {"task_variety", "task_preferences"},
        {"social_interaction", "task_preferences"},
        {"company_values", "values_culture"},
    };
    return m;
}

VignetteConverter::VignetteConverter(const ProfileGenerator& generator) : m_generator(generator) {}

std::string VignetteConverter::infer_category(const JobProfile& a, const JobProfile& b) const {
    std::string best_attr;
    double best_diff = -1.0;

    for (const auto& spec : m_generator.attributes()) {
        auto ia = a.find(spec.name);
        auto ib = b.find(spec.name);
        const double va = ia == a.end() ? 0.0 : ia->second;
        const double vb = ib == b.end() ? 0.0 : ib->second;

        double diff = std::abs(va - vb);
        if (spec.type == AttributeType::Ordered) {
            double lo = spec.levels.front().value;
            double hi = lo;
            for (const auto& l : spec.levels) {
                lo = std::min(lo, l.value);
                hi = std::max(hi, l.value);
            }
            diff = hi > lo ? diff / (hi - lo) : 0.0;
        }

        if (diff > best_diff) {
            best_diff = diff;
            best_attr = spec.name;
        }
    }

    if (best_diff < 0.1) return "mixed";

    const auto& cats = attribute_categories();
    auto it = cats.find(best_attr);
    return it == cats.end() ? "mixed" : it->second;
}

std::string VignetteConverter::scenario_text(const std::string& category) {
    static const std::map<std::string, std::string> templates = {
        {"financial", "Consider these two job opportunities with different compensation packages:"},
        {"work_environment", "Consider these two job opportunities with different work environments:"},
        {"job_security", "Consider these two job opportunities with different levels of job security:"},
        {"career_advancement", "Consider these two job opportunities with different growth potential:"},
        {"work_life_balance", "Consider these two job opportunities with different work-life balance:"},
    };

    auto it = templates.find(category);
    if (it != templates.end()) return it->second;
    return "Consider these two job opportunities with different trade-offs:";
}

std::string VignetteConverter::option_title(const std::string& option_id, const JobProfile& profile) const {
    auto it = profile.find("wage");
    const AttributeSpec* wage = m_generator.find_attribute("wage");

    if (it != profile.end() && wage) {
        for (const auto& l : wage->levels) {
            if (l.value == it->second) return "Option " + option_id + ": Job paying " + l.label + " per month";
        }
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.0f", it->second);
        return "Option " + option_id + ": Job paying " + buf + " per month";
    }

    return "Option " + option_id + ": Job opportunity";
}

Vignette VignetteConverter::convert(const ProfilePair& pair, const std::string& vignette_id) const {
    Vignette v;
    v.vignette_id = vignette_id;
    v.category = infer_category(pair.first, pair.second);
    v.scenario_text = scenario_text(v.category);

    const JobProfile* profiles[2] = {&pair.first, &pair.second};
    const char* ids[2] = {"A", "B"};
    for (int i = 0; i < 2; ++i) {
        VignetteOption& o = v.options[static_cast<size_t>(i)];
        o.option_id = ids[i];
        o.title = option_title(ids[i], *profiles[i]);
        o.description = m_generator.profile_to_string(*profiles[i]);
        o.attributes = *profiles[i];
    }

    return v;
}

static std::string numbered(const std::string& prefix, size_t n) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03zu", n);
    return prefix + buf;
}

VignetteLibrary VignetteConverter::convert_library(const StaticDesign& design,
                                                   const std::vector<ProfilePair>& adaptive) const {
    VignetteLibrary lib;

    for (size_t i = 0; i < design.beginning.size(); ++i) {
        lib.static_beginning.push_back(convert(design.beginning[i], numbered("static_begin_", i + 1)));
    }
    for (size_t i = 0; i < design.end.size(); ++i) {
        lib.static_end.push_back(convert(design.end[i], numbered("static_end_", i + 1)));
    }
    for (size_t i = 0; i < adaptive.size(); ++i) {
        lib.adaptive.push_back(convert(adaptive[i], numbered("adaptive_", i + 1)));
    }

    return lib;
}

}  // namespace elicit
