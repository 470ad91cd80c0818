/**
 * @file test_fisher_information.cpp
 * @brief Per-vignette and cumulative Fisher information
 */

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "elicit/FisherInformation.hpp"
#include "TestVignettes.hpp"

using namespace elicit;

static int numeric_rank(const InformationMatrix& m) {
    Eigen::FullPivLU<InformationMatrix> lu(m);
    lu.setThreshold(1e-6);
    return static_cast<int>(lu.rank());
}

static std::vector<const Vignette*> pointers(const std::vector<Vignette>& vs) {
    std::vector<const Vignette*> out;
    for (const auto& v : vs) out.push_back(&v);
    return out;
}

TEST(FisherInformationTest, SingleVignetteOuterProduct) {
    FisherInformationCalculator fic;
    const Vignette v = testutil::tradeoff("v", 0, 1);   // d = (2, -1, 0, ...)

    const InformationMatrix fim = fic.compute_fim(v, FeatureVector::Zero());
    EXPECT_NEAR(fim(0, 0), 0.25 * 4.0 + 1e-8, 1e-14);
    EXPECT_NEAR(fim(0, 1), 0.25 * -2.0, 1e-14);
    EXPECT_NEAR(fim(1, 1), 0.25 + 1e-8, 1e-14);
    EXPECT_NEAR(fim(3, 3), 1e-8, 1e-14);
    EXPECT_TRUE(fim.isApprox(fim.transpose()));
}

TEST(FisherInformationTest, ConfidentChoicesCarryLessInformation) {
    FisherInformationCalculator fic;
    const Vignette v = testutil::tradeoff("v", 2, 3);

    FeatureVector strong = FeatureVector::Zero();
    strong[2] = 5.0;
    EXPECT_LT(fic.compute_fim(v, strong).trace(), fic.compute_fim(v, FeatureVector::Zero()).trace());
}

TEST(FisherInformationTest, EmptyCumulativeIsZero) {
    FisherInformationCalculator fic;
    EXPECT_TRUE(fic.compute_cumulative_fim({}, FeatureVector::Zero()).isZero());
    EXPECT_THROW(fic.compute_cumulative_fim({nullptr}, FeatureVector::Zero()), std::invalid_argument);
}

TEST(FisherInformationTest, EigenvaluesNonDecreasingAsVignettesAdded) {
    FisherInformationCalculator fic;
    const auto span = testutil::spanning_set();
    FeatureVector theta;
    theta << 0.2, -0.1, 0.4, 0.0, 0.3, -0.2, 0.1;

    std::vector<const Vignette*> done;
    Eigen::Matrix<double, kNumDimensions, 1> prev = Eigen::Matrix<double, kNumDimensions, 1>::Zero();

    for (const auto& v : span) {
        done.push_back(&v);
        const InformationMatrix fim = fic.compute_cumulative_fim(done, theta);
        Eigen::SelfAdjointEigenSolver<InformationMatrix> eig(fim);
        const auto cur = eig.eigenvalues();   // ascending
        for (int k = 0; k < kNumDimensions; ++k) EXPECT_GE(cur[k], prev[k] - 1e-12);
        prev = cur;
    }
}

TEST(FisherInformationTest, DiverseSetReachesFullRank) {
    FisherInformationCalculator fic;
    const auto span = testutil::spanning_set();
    auto ptrs = pointers(span);

    const InformationMatrix full = fic.compute_cumulative_fim(ptrs, FeatureVector::Zero());
    EXPECT_EQ(numeric_rank(full), 7);
    EXPECT_GT(full.determinant(), 0.0);

    ptrs.pop_back();   // wage against each single dimension only
    EXPECT_EQ(numeric_rank(fic.compute_cumulative_fim(ptrs, FeatureVector::Zero())), 6);
}

TEST(FisherInformationTest, ExpectedInformationReportsDeterminantGain) {
    FisherInformationCalculator fic;
    const InformationMatrix current = InformationMatrix::Identity();
    const Vignette v = testutil::tradeoff("v", 4, 6);

    const ExpectedInformation e = fic.compute_expected_fim(v, FeatureVector::Zero(), current);
    EXPECT_TRUE(e.fim.isApprox(current + fic.compute_fim(v, FeatureVector::Zero())));
    EXPECT_NEAR(e.determinant_increase, e.fim.determinant() - 1.0, 1e-12);
    EXPECT_GT(e.determinant_increase, 0.0);
}

TEST(FisherInformationTest, DEfficiency) {
    EXPECT_NEAR(FisherInformationCalculator::d_efficiency(InformationMatrix::Identity()), 1.0, 1e-12);
    EXPECT_NEAR(FisherInformationCalculator::d_efficiency(2.0 * InformationMatrix::Identity()), 2.0, 1e-12);
    EXPECT_EQ(FisherInformationCalculator::d_efficiency(InformationMatrix::Zero()), 0.0);

    InformationMatrix d = InformationMatrix::Identity();
    d(5, 5) = 3.0;
    EXPECT_TRUE(FisherInformationCalculator::information_per_dimension(d).isApprox(d.diagonal()));
}

TEST(FisherInformationTest, NegativeRegularizationRejected) {
    EXPECT_THROW(FisherInformationCalculator(LikelihoodCalculator(), -1.0), std::invalid_argument);
}

TEST(FisherInformationTest, BayesianGainWeightsByDirectionalVariance) {
    FisherInformationCalculator fic;
    const InformationMatrix current = 2.0 * InformationMatrix::Identity();
    const Vignette v = testutil::tradeoff("v", 1, 3);   // d = e1 - e3

    InformationMatrix cov = InformationMatrix::Identity();
    cov(3, 3) = 4.0;

    const ExpectedInformation plain = fic.compute_expected_fim(v, FeatureVector::Zero(), current);
    const ExpectedInformation bayes = fic.compute_bayesian_expected_fim(v, FeatureVector::Zero(), cov, current);

    EXPECT_TRUE(bayes.fim.isApprox(plain.fim));
    // d^T (cov + 1e-8 I) d = 1 + 4 + 2e-8
    EXPECT_NEAR(bayes.determinant_increase, plain.determinant_increase * (6.0 + 2e-8), 1e-9);
}

TEST(FisherInformationTest, DEfficiencyIsSeventhRootOfDeterminant) {
    FisherInformationCalculator fic;
    const InformationMatrix current = InformationMatrix::Identity();
    const Vignette v = testutil::tradeoff("v", 0, 2);

    const ExpectedInformation e = fic.compute_expected_fim(v, FeatureVector::Zero(), current);
    const double det = FisherInformationCalculator::determinant(e.fim);

    EXPECT_NEAR(std::pow(FisherInformationCalculator::d_efficiency(e.fim), 7.0), det, 1e-9);
    // gain stays on the raw determinant scale
    EXPECT_NEAR(e.determinant_increase, det - 1.0, 1e-12);
    EXPECT_GT(e.determinant_increase,
              FisherInformationCalculator::d_efficiency(e.fim) - FisherInformationCalculator::d_efficiency(current));
}
