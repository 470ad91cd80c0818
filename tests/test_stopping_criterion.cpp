/**
 * @file test_stopping_criterion.cpp
 * @brief Stopping rule precedence and diagnostics
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "elicit/StoppingCriterion.hpp"

using namespace elicit;

namespace {

PreferenceEstimate with_variance(double var) {
    PreferenceEstimate p;
    p.covariance = var * InformationMatrix::Identity();
    return p;
}

bool mentions(const std::string& reason, const std::string& word) {
    return reason.find(word) != std::string::npos;
}

}  // namespace

TEST(StoppingCriterionTest, BelowMinimumAlwaysContinues) {
    StoppingCriterion sc;
    const InformationMatrix huge = 1e6 * InformationMatrix::Identity();

    const StoppingResult r = sc.should_continue(with_variance(0.01), huge, 2);
    EXPECT_TRUE(r.should_continue);
    EXPECT_EQ(r.decision, StoppingDecision::Continue);
    EXPECT_TRUE(mentions(r.reason, "minimum"));
}

TEST(StoppingCriterionTest, MaximumStopsEvenWithHighVariance) {
    StoppingCriterion sc;
    const StoppingResult r = sc.should_continue(with_variance(5.0), InformationMatrix::Zero(), 12);
    EXPECT_FALSE(r.should_continue);
    EXPECT_EQ(r.decision, StoppingDecision::Stop);
    EXPECT_TRUE(mentions(r.reason, "maximum"));
}

TEST(StoppingCriterionTest, DeterminantThresholdStops) {
    StoppingCriterion sc;
    const StoppingResult r = sc.should_continue(with_variance(1.0), 10.0 * InformationMatrix::Identity(), 5);
    EXPECT_FALSE(r.should_continue);
    EXPECT_TRUE(mentions(r.reason, "determinant"));
}

TEST(StoppingCriterionTest, DeterminantComparisonIsStrict) {
    StoppingThresholds t;
    t.fim_det_threshold = 1.0;
    StoppingCriterion sc(t);
    EXPECT_TRUE(sc.should_continue(with_variance(1.0), InformationMatrix::Identity(), 5).should_continue);
}

TEST(StoppingCriterionTest, VarianceThresholdStops) {
    StoppingCriterion sc;
    const StoppingResult r = sc.should_continue(with_variance(0.5), InformationMatrix::Zero(), 5);
    EXPECT_FALSE(r.should_continue);
    EXPECT_TRUE(mentions(r.reason, "variance"));
}

TEST(StoppingCriterionTest, OneUncertainDimensionKeepsGoing) {
    StoppingCriterion sc;
    PreferenceEstimate p = with_variance(0.1);
    p.covariance(6, 6) = 0.9;

    const StoppingResult r = sc.should_continue(p, InformationMatrix::Identity(), 6);
    EXPECT_TRUE(r.should_continue);
    EXPECT_TRUE(mentions(r.reason, "uncertainty"));
}

TEST(StoppingCriterionTest, Diagnostics) {
    StoppingCriterion sc;
    PreferenceEstimate p = with_variance(0.4);
    p.covariance(1, 1) = 0.8;

    const StoppingDiagnostics d = sc.diagnostics(p, 2.0 * InformationMatrix::Identity(), 7);
    EXPECT_EQ(d.n_vignettes_shown, 7);
    EXPECT_NEAR(d.fim_determinant, 128.0, 1e-9);
    EXPECT_NEAR(d.max_variance, 0.8, 1e-12);
    EXPECT_NEAR(d.min_variance, 0.4, 1e-12);
    EXPECT_NEAR(d.mean_variance, (6 * 0.4 + 0.8) / 7.0, 1e-12);
    EXPECT_NEAR(d.uncertainty_per_dimension[1], 0.8, 1e-12);
    EXPECT_FALSE(d.meets_det_threshold);
    EXPECT_FALSE(d.meets_variance_threshold);
    EXPECT_TRUE(d.within_vignette_limits);

    EXPECT_FALSE(sc.diagnostics(p, InformationMatrix::Zero(), 13).within_vignette_limits);
}

TEST(StoppingCriterionTest, InvalidThresholdsRejected) {
    StoppingThresholds t;
    t.min_vignettes = 0;
    EXPECT_THROW(StoppingCriterion{t}, std::invalid_argument);

    t = StoppingThresholds{};
    t.max_vignettes = 3;
    EXPECT_THROW(StoppingCriterion{t}, std::invalid_argument);

    t = StoppingThresholds{};
    t.max_variance_threshold = 0.0;
    EXPECT_THROW(StoppingCriterion{t}, std::invalid_argument);
}

TEST(StoppingCriterionTest, DecisionNames) {
    EXPECT_STREQ(to_string(StoppingDecision::Stop), "STOP");
    EXPECT_STREQ(to_string(StoppingDecision::Continue), "CONTINUE");
}
