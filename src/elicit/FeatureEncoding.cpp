#include "elicit/FeatureEncoding.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace elicit {

const std::array<const char*, kNumDimensions> kDimensionNames = {
    "financial",
    "work_environment",
    "career_growth",
    "work_life_balance",
    "job_security",
    "task_preference",
    "values_culture",
};

const VignetteOption* Vignette::find_option(const std::string& option_id) const {
    for (const auto& o : options) {
        if (o.option_id == option_id) return &o;
    }
    return nullptr;
}

namespace {

struct MeanAccumulator {
    double sum = 0.0;
    int count = 0;

    void add(double x) {
        sum += x;
        ++count;
    }
    double value() const { return count > 0 ? sum / count : 0.0; }
};

// First of the given keys present in the map.
const double* lookup(const AttributeMap& attrs, const char* key, const char* alias = nullptr) {
    auto it = attrs.find(key);
    if (it == attrs.end() && alias) it = attrs.find(alias);
    if (it == attrs.end()) return nullptr;
    if (!std::isfinite(it->second)) {
        throw std::invalid_argument(std::string("attribute '") + it->first + "' is not a finite number");
    }
    return &it->second;
}

}  // namespace

double commute_score(double minutes) {
    return std::clamp((60.0 - minutes) / 45.0, 0.0, 1.0);
}

FeatureVector encode_attributes(const AttributeMap& attributes) {
    FeatureVector f = FeatureVector::Zero();

    if (const double* wage = lookup(attributes, "wage", "salary")) {
        f[0] = *wage / 10000.0;
    }

    const double* commute = lookup(attributes, "commute_time");

    MeanAccumulator work_env;
    if (const double* v = lookup(attributes, "physical_demand")) work_env.add(1.0 - *v);
    if (const double* v = lookup(attributes, "remote_work", "remote")) work_env.add(*v);
    if (commute) work_env.add(commute_score(*commute));
    f[1] = work_env.value();

    if (const double* v = lookup(attributes, "career_growth")) f[2] = *v;

    MeanAccumulator balance;
    if (const double* v = lookup(attributes, "flexibility")) balance.add(*v);
    if (commute) balance.add(commute_score(*commute));
    f[3] = balance.value();

    if (const double* v = lookup(attributes, "job_security")) f[4] = *v;

    MeanAccumulator task;
    if (const double* v = lookup(attributes, "task_variety")) task.add(*v);
    if (const double* v = lookup(attributes, "social_interaction")) task.add(*v);
    f[5] = task.value();

    if (const double* v = lookup(attributes, "company_values", "culture_alignment")) f[6] = *v;

    return f;
}

int dimension_index(const std::string& name) {
    for (int i = 0; i < kNumDimensions; ++i) {
        if (name == kDimensionNames[i]) return i;
    }
    return -1;
}

}  // namespace elicit
