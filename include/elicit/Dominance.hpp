#pragma once

#include <vector>

#include "elicit/Models.hpp"
#include "elicit/ProfileGenerator.hpp"

namespace elicit {

constexpr double kDominanceTolerance = 1e-6;

// fa >= fb in every dimension and fa > fb in at least one (within tol).
bool features_dominate(const FeatureVector& fa, const FeatureVector& fb, double tol = kDominanceTolerance);

// Either side dominates the other. Identical inputs are never dominated.
bool has_pairwise_dominance(const FeatureVector& fa, const FeatureVector& fb, double tol = kDominanceTolerance);
bool has_pairwise_dominance(const JobProfile& a, const JobProfile& b);
bool has_pairwise_dominance(const Vignette& v);

// One side strictly better in at least `threshold` of the 7 dimensions.
bool has_quasi_dominance(const FeatureVector& fa, const FeatureVector& fb, int threshold = 5);

// Higher/lower wage ratio above max_ratio; false if either wage is missing or zero.
bool has_excessive_wage_gap(const JobProfile& a, const JobProfile& b, double max_ratio = 1.67);

// Raw attributes feeding an averaged dimension differ, yet the encoded dimension is equal
// (e.g. task_variety and social_interaction swapped between the two options).
bool has_attribute_cancellation(const JobProfile& a, const JobProfile& b);

bool encodes_identically(const JobProfile& a, const JobProfile& b);

// Non-dominated vignettes, input order preserved.
std::vector<const Vignette*> filter_dominated(const std::vector<const Vignette*>& vignettes);

}  // namespace elicit
