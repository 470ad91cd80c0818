#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "elicit/Models.hpp"

namespace elicit {

enum class AttributeType {
    Ordered,
    Categorical
};

struct AttributeLevel {
    double value = 0.0;
    std::string label;
};

struct AttributeSpec {
    std::string name;    // key used in AttributeMap, e.g. "commute_time"
    std::string label;   // human readable, e.g. "Commute time"
    AttributeType type = AttributeType::Categorical;
    std::vector<AttributeLevel> levels;
};

using JobProfile = AttributeMap;
using ProfilePair = std::pair<JobProfile, JobProfile>;

// Ten job attributes: wage and commute are ordered, the rest binary.
std::vector<AttributeSpec> default_attribute_design();

class ProfileGenerator {
public:
    ProfileGenerator();
    explicit ProfileGenerator(std::vector<AttributeSpec> design);

    const std::vector<AttributeSpec>& attributes() const { return m_attrs; }
    const AttributeSpec* find_attribute(const std::string& name) const;

    // Cartesian product of all levels in declaration order; max_profiles == 0 means all.
    std::vector<JobProfile> generate_all_profiles(size_t max_profiles = 0) const;

    // All i<j pairs when there are at most sample_size of them, otherwise
    // sample_size distinct pairs drawn from rng.
    std::vector<ProfilePair> generate_candidates(std::mt19937_64& rng, size_t sample_size) const;
    std::vector<ProfilePair> generate_candidates(const std::vector<JobProfile>& profiles,
                                                 std::mt19937_64& rng,
                                                 size_t sample_size) const;

    FeatureVector encode_profile(const JobProfile& profile) const;

    std::string profile_to_string(const JobProfile& profile) const;

    uint64_t total_combinations() const;

private:
    std::vector<AttributeSpec> m_attrs;

    static void validate_design(const std::vector<AttributeSpec>& design);
};

}  // namespace elicit
