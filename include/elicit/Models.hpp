#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace elicit {

constexpr int kNumDimensions = 7;

using FeatureVector = Eigen::Matrix<double, kNumDimensions, 1>;
using InformationMatrix = Eigen::Matrix<double, kNumDimensions, kNumDimensions>;

// attribute name -> raw level (wage in currency units, commute in minutes, 0/1 flags)
using AttributeMap = std::map<std::string, double>;

// Index i of a FeatureVector is the preference dimension kDimensionNames[i].
extern const std::array<const char*, kNumDimensions> kDimensionNames;

struct VignetteOption {
    std::string option_id;       // "A" or "B"
    std::string title;
    std::string description;
    AttributeMap attributes;
};

struct Vignette {
    std::string vignette_id;     // unique, stable
    std::string category;        // financial, work_environment, ...
    std::string difficulty_level = "medium";
    std::string scenario_text;
    std::array<VignetteOption, 2> options;

    // nullptr if no option carries this id
    const VignetteOption* find_option(const std::string& option_id) const;
};

// Vignettes by phase; static lists are shown in order.
struct VignetteLibrary {
    std::vector<Vignette> static_beginning;
    std::vector<Vignette> static_end;
    std::vector<Vignette> adaptive;

    size_t size() const { return static_beginning.size() + static_end.size() + adaptive.size(); }
};

struct UserContext {
    std::string current_role;
    std::string industry;
    std::string experience_level;
};

struct PreferenceEstimate {
    FeatureVector mean = FeatureVector::Zero();
    InformationMatrix covariance = InformationMatrix::Identity();

    double variance(int dim) const { return covariance(dim, dim); }
    double max_variance() const { return covariance.diagonal().maxCoeff(); }
};

}  // namespace elicit
