#pragma once

#include "elicit/Models.hpp"

namespace elicit {

// Bumped whenever the attribute -> feature table changes; written into
// generated libraries so stale files can be detected.
constexpr int kFeatureEncodingVersion = 1;

// Maps raw job attributes onto the 7 preference dimensions.
//
//   0 financial          wage / 10000                          (alias: salary)
//   1 work_environment   mean(1 - physical_demand, remote_work, commute_score)
//   2 career_growth      career_growth
//   3 work_life_balance  mean(flexibility, commute_score)
//   4 job_security       job_security
//   5 task_preference    mean(task_variety, social_interaction)
//   6 values_culture     company_values                        (alias: culture_alignment)
//
// commute_score = clamp((60 - commute_time) / 45, 0, 1). The upper clamp holds
// commutes under 15 minutes at 1, the same range as the binary attributes.
// Only attributes that are present enter a mean; a dimension with none of its
// attributes is 0.
FeatureVector encode_attributes(const AttributeMap& attributes);

double commute_score(double minutes);

// Index of a dimension name, or -1.
int dimension_index(const std::string& name);

}  // namespace elicit
