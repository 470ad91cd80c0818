#include "elicit/ProfileGenerator.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "elicit/FeatureEncoding.hpp"

namespace elicit {

static AttributeSpec binary_attribute(const std::string& name,
                                      const std::string& label,
                                      const std::string& low,
                                      const std::string& high) {
    AttributeSpec s;
    s.name = name;
    s.label = label;
    s.type = AttributeType::Categorical;
    s.levels = {{0.0, low}, {1.0, high}};
    return s;
}

std::vector<AttributeSpec> default_attribute_design() {
    std::vector<AttributeSpec> d;

    AttributeSpec wage;
    wage.name = "wage";
    wage.label = "Monthly wage";
    wage.type = AttributeType::Ordered;
    wage.levels = {{15000, "15,000"}, {20000, "20,000"}, {25000, "25,000"}, {30000, "30,000"}};
    d.push_back(wage);

    d.push_back(binary_attribute("physical_demand", "Physical demand", "Low physical demand", "High physical demand"));
    d.push_back(binary_attribute("flexibility", "Working hours", "Fixed hours", "Flexible hours"));

    AttributeSpec commute;
    commute.name = "commute_time";
    commute.label = "Commute time";
    commute.type = AttributeType::Ordered;
    commute.levels = {{15, "15 minutes"}, {30, "30 minutes"}, {45, "45 minutes"}, {60, "60 minutes"}};
    d.push_back(commute);

    d.push_back(binary_attribute("job_security", "Job security", "Short-term contract", "Permanent position"));
    d.push_back(binary_attribute("remote_work", "Remote work", "On-site only", "Remote work possible"));
    d.push_back(binary_attribute("career_growth", "Career growth", "Limited advancement", "Clear promotion path"));
    d.push_back(binary_attribute("task_variety", "Tasks", "Routine tasks", "Varied tasks"));
    d.push_back(binary_attribute("social_interaction", "Teamwork", "Mostly independent", "Highly collaborative"));
    d.push_back(binary_attribute("company_values", "Company mission", "Standard employer", "Mission-driven employer"));

    return d;
}

ProfileGenerator::ProfileGenerator() : m_attrs(default_attribute_design()) {}

ProfileGenerator::ProfileGenerator(std::vector<AttributeSpec> design) : m_attrs(std::move(design)) {
    validate_design(m_attrs);
}

void ProfileGenerator::validate_design(const std::vector<AttributeSpec>& design) {
    if (design.empty()) throw std::invalid_argument("attribute design is empty");

    std::unordered_set<std::string> names;
    for (const auto& a : design) {
        if (a.name.empty()) throw std::invalid_argument("attribute with empty name");
        if (!names.insert(a.name).second) {
            throw std::invalid_argument("duplicate attribute: " + a.name);
        }
        if (a.levels.size() < 2) {
            throw std::invalid_argument("attribute " + a.name + " needs at least two levels");
        }
        for (const auto& l : a.levels) {
            if (!std::isfinite(l.value)) {
                throw std::invalid_argument("attribute " + a.name + " has a non-finite level");
            }
        }
    }
}

const AttributeSpec* ProfileGenerator::find_attribute(const std::string& name) const {
    for (const auto& a : m_attrs) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

// Categorical attributes are binary-encoded (0 = base level, 1 = other).
static std::vector<double> level_values(const AttributeSpec& a) {
    if (a.type == AttributeType::Categorical) return {0.0, 1.0};

    std::vector<double> out;
    out.reserve(a.levels.size());
    for (const auto& l : a.levels) out.push_back(l.value);
    return out;
}

std::vector<JobProfile> ProfileGenerator::generate_all_profiles(size_t max_profiles) const {
    std::vector<std::vector<double>> values;
    values.reserve(m_attrs.size());
    for (const auto& a : m_attrs) values.push_back(level_values(a));

    std::vector<JobProfile> profiles;
    std::vector<size_t> idx(m_attrs.size(), 0);

    // odometer over the level indices, last attribute varying fastest
    while (true) {
        JobProfile p;
        for (size_t i = 0; i < m_attrs.size(); ++i) p[m_attrs[i].name] = values[i][idx[i]];
        profiles.push_back(std::move(p));
        if (max_profiles > 0 && profiles.size() >= max_profiles) break;

        size_t k = m_attrs.size();
        while (k > 0) {
            --k;
            if (++idx[k] < values[k].size()) break;
            idx[k] = 0;
            if (k == 0) return profiles;
        }
    }

    return profiles;
}

std::vector<ProfilePair> ProfileGenerator::generate_candidates(std::mt19937_64& rng, size_t sample_size) const {
    return generate_candidates(generate_all_profiles(), rng, sample_size);
}

std::vector<ProfilePair> ProfileGenerator::generate_candidates(const std::vector<JobProfile>& profiles,
                                                               std::mt19937_64& rng,
                                                               size_t sample_size) const {
    std::vector<ProfilePair> pairs;
    const size_t n = profiles.size();
    if (n < 2) return pairs;

    const uint64_t total_pairs = static_cast<uint64_t>(n) * (n - 1) / 2;

    if (total_pairs <= sample_size) {
        pairs.reserve(static_cast<size_t>(total_pairs));
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) pairs.emplace_back(profiles[i], profiles[j]);
        }
        return pairs;
    }

    std::uniform_int_distribution<size_t> pick(0, n - 1);
    std::unordered_set<uint64_t> seen;
    seen.reserve(sample_size * 2);
    pairs.reserve(sample_size);

    while (pairs.size() < sample_size) {
        size_t i = pick(rng);
        size_t j = pick(rng);
        if (i == j) continue;
        if (i > j) std::swap(i, j);

        const uint64_t key = static_cast<uint64_t>(i) * n + j;
        if (!seen.insert(key).second) continue;

        pairs.emplace_back(profiles[i], profiles[j]);
    }

    return pairs;
}

FeatureVector ProfileGenerator::encode_profile(const JobProfile& profile) const {
    return encode_attributes(profile);
}

std::string ProfileGenerator::profile_to_string(const JobProfile& profile) const {
    std::ostringstream oss;
    bool first = true;

    for (const auto& a : m_attrs) {
        auto it = profile.find(a.name);
        if (it == profile.end()) continue;

        std::string level_label;
        if (a.type == AttributeType::Ordered) {
            for (const auto& l : a.levels) {
                if (l.value == it->second) level_label = l.label;
            }
        } else {
            const size_t k = it->second != 0.0 ? 1 : 0;
            if (k < a.levels.size()) level_label = a.levels[k].label;
        }
        if (level_label.empty()) continue;

        if (!first) oss << " | ";
        oss << a.label << ": " << level_label;
        first = false;
    }

    return oss.str();
}

uint64_t ProfileGenerator::total_combinations() const {
    uint64_t total = 1;
    for (const auto& a : m_attrs) total *= level_values(a).size();
    return total;
}

}  // namespace elicit
