/**
 * @file test_session_snapshot.cpp
 * @brief Session state and the persisted JSON formats
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "elicit/PosteriorManager.hpp"
#include "elicit/VignetteEngine.hpp"
#include "io/JsonIO.hpp"
#include "TestVignettes.hpp"

using namespace elicit;
using json = nlohmann::json;

namespace {

SessionState answered_session(const VignetteEngine& engine) {
    SessionState s = SessionState::create("snap-1", engine.config());
    const UserContext ctx;
    for (int i = 0; i < 6; ++i) {
        const Vignette* v = engine.select_next_vignette(s, ctx);
        if (!v) break;
        engine.record_response(s, v->vignette_id, i % 3 == 0 ? "B" : "A");
    }
    return s;
}

std::string error_of(const json& j) {
    try {
        session_from_json(j);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

}  // namespace

TEST(SessionStateTest, CreateFromPrior) {
    AdaptiveConfig cfg;
    cfg.prior_mean = FeatureVector::Constant(0.5);
    cfg.prior_variance = 2.0;

    const SessionState s = SessionState::create("abc", cfg);
    EXPECT_EQ(s.session_id, "abc");
    EXPECT_TRUE(s.posterior.mean.isApprox(cfg.prior_mean));
    EXPECT_DOUBLE_EQ(s.posterior.variance(4), 2.0);
    EXPECT_TRUE(s.fisher_information_matrix.isZero());
    EXPECT_TRUE(s.completed_vignettes.empty());
    EXPECT_FALSE(s.adaptive_phase_complete);

    EXPECT_THROW(SessionState::create("", cfg), std::invalid_argument);
}

TEST(SessionStateTest, CompletedIsAppendOnlyWithoutDuplicates) {
    SessionState s = SessionState::create("abc", AdaptiveConfig{});
    EXPECT_TRUE(s.mark_completed("v1"));
    EXPECT_TRUE(s.mark_completed("v2"));
    EXPECT_FALSE(s.mark_completed("v1"));
    ASSERT_EQ(s.completed_vignettes.size(), 2u);
    EXPECT_EQ(s.completed_vignettes[0], "v1");
    EXPECT_TRUE(s.is_completed("v2"));
    EXPECT_EQ(s.find_response("v1"), nullptr);
}

TEST(SessionSnapshotTest, JsonRoundTripIsExact) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    const SessionState s = answered_session(engine);
    ASSERT_EQ(s.completed_vignettes.size(), 6u);

    const json j = session_to_json(s);

    std::set<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.insert(it.key());
    EXPECT_EQ(keys, (std::set<std::string>{"session_id", "posterior_mean", "posterior_covariance",
                                           "fisher_information_matrix", "completed_vignettes",
                                           "adaptive_vignettes_shown_count", "adaptive_phase_complete",
                                           "responses"}));

    const SessionState back = session_from_json(json::parse(j.dump()));
    EXPECT_EQ(back.session_id, s.session_id);
    EXPECT_EQ(back.completed_vignettes, s.completed_vignettes);
    EXPECT_EQ(back.adaptive_vignettes_shown_count, s.adaptive_vignettes_shown_count);
    EXPECT_EQ(back.adaptive_phase_complete, s.adaptive_phase_complete);
    EXPECT_LT((back.posterior.mean - s.posterior.mean).cwiseAbs().maxCoeff(), 1e-15);
    EXPECT_LT((back.posterior.covariance - s.posterior.covariance).cwiseAbs().maxCoeff(), 1e-15);
    EXPECT_LT((back.fisher_information_matrix - s.fisher_information_matrix).cwiseAbs().maxCoeff(), 1e-15);

    ASSERT_EQ(back.responses.size(), s.responses.size());
    EXPECT_EQ(back.responses[0].chosen_option_id, "B");
}

TEST(SessionSnapshotTest, FileRoundTripAndReplay) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    const SessionState s = answered_session(engine);

    const auto path = std::filesystem::temp_directory_path() / "pref_elicit_test" / "snapshot.json";
    write_session_snapshot(path, s);
    SessionState back = read_session_snapshot(path.string());
    EXPECT_EQ(back.completed_vignettes, s.completed_vignettes);

    // the event log alone reproduces the derived estimates
    back.posterior = PreferenceEstimate{};
    back.fisher_information_matrix.setZero();
    engine.replay(back);
    EXPECT_LT((back.posterior.mean - s.posterior.mean).norm(), 1e-9);
    EXPECT_LT((back.fisher_information_matrix - s.fisher_information_matrix).norm(), 1e-9);

    std::filesystem::remove_all(path.parent_path());
}

TEST(SessionSnapshotTest, ShapeErrorsNameThePath) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    const json good = session_to_json(SessionState::create("x", engine.config()));

    json short_mean = good;
    short_mean["posterior_mean"].erase(0);
    EXPECT_NE(error_of(short_mean).find("root.posterior_mean"), std::string::npos);

    json text_entry = good;
    text_entry["posterior_mean"][3] = "high";
    EXPECT_EQ(error_of(text_entry), "root.posterior_mean[3] must be a number");

    json bad_row = good;
    bad_row["fisher_information_matrix"][2] = json::array({1, 2});
    EXPECT_NE(error_of(bad_row).find("root.fisher_information_matrix[2]"), std::string::npos);

    json missing = good;
    missing.erase("adaptive_phase_complete");
    EXPECT_NE(error_of(missing).find("adaptive_phase_complete"), std::string::npos);

    json dup = good;
    dup["completed_vignettes"] = json::array({"a", "a"});
    EXPECT_NE(error_of(dup).find("root.completed_vignettes[1]"), std::string::npos);
}

TEST(VignetteLibraryIoTest, WriteThenLoad) {
    const VignetteLibrary lib = testutil::make_library(5);
    const auto path = std::filesystem::temp_directory_path() / "pref_elicit_test_lib" / "library.json";
    write_vignette_library(path, lib);

    const VignetteLibrary back = load_vignette_library(path.string());
    ASSERT_EQ(back.static_beginning.size(), 4u);
    ASSERT_EQ(back.adaptive.size(), 5u);
    ASSERT_EQ(back.static_end.size(), 2u);
    EXPECT_EQ(back.static_beginning[2].vignette_id, "static_begin_003");
    EXPECT_EQ(back.adaptive[0].options[0].attributes, lib.adaptive[0].options[0].attributes);
    EXPECT_EQ(back.adaptive[0].options[1].option_id, "B");

    std::filesystem::remove_all(path.parent_path());
}

TEST(VignetteLibraryIoTest, ParseVignetteValidatesShape) {
    json v = vignette_to_json(testutil::tradeoff("v1", 0, 2));
    EXPECT_EQ(parse_vignette(v, "v").vignette_id, "v1");

    json bool_attr = v;
    bool_attr["options"][1]["attributes"]["remote_work"] = true;
    EXPECT_EQ(parse_vignette(bool_attr, "v").options[1].attributes.at("remote_work"), 1.0);

    json three = v;
    three["options"].push_back(three["options"][0]);
    EXPECT_THROW(parse_vignette(three, "v"), std::runtime_error);

    json same_ids = v;
    same_ids["options"][1]["option_id"] = "A";
    EXPECT_THROW(parse_vignette(same_ids, "v"), std::runtime_error);

    json same_encoding = v;
    same_encoding["options"][1]["attributes"] = {{"salary", 20000}};   // alias of wage, same level as option A
    try {
        parse_vignette(same_encoding, "v");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "v.options encode to the same feature vector");
    }

    json text_level = v;
    text_level["options"][0]["attributes"]["wage"] = "lots";
    EXPECT_THROW(parse_vignette(text_level, "v"), std::runtime_error);
}

TEST(SessionSnapshotTest, SnapshotWithoutResponsesResumesFromPosterior) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    const SessionState answered = answered_session(engine);

    json j = session_to_json(answered);
    j.erase("responses");
    SessionState restored = session_from_json(j);

    ASSERT_TRUE(restored.log_prior.has_value());
    EXPECT_TRUE(restored.responses.empty());
    EXPECT_TRUE(restored.log_prior->mean.isApprox(answered.posterior.mean));

    SessionState direct = answered;
    const Vignette* next = engine.select_next_vignette(direct, UserContext{});
    ASSERT_NE(next, nullptr);
    const Vignette* next_restored = engine.select_next_vignette(restored, UserContext{});
    ASSERT_NE(next_restored, nullptr);
    EXPECT_EQ(next_restored->vignette_id, next->vignette_id);

    engine.record_response(direct, next->vignette_id, "A");
    engine.record_response(restored, next->vignette_id, "A");

    // the new answer refines the persisted posterior rather than the prior
    PosteriorManager seeded(answered.posterior.mean, answered.posterior.covariance, engine.config().newton_options());
    LikelihoodCalculator likelihood(engine.config().temperature);
    seeded.update(likelihood.create_likelihood_function(*next, "A"), Observation{next->vignette_id, "A"});
    EXPECT_LT((restored.posterior.mean - seeded.posterior().mean).norm(), 1e-9);

    for (int i = 0; i < kNumDimensions; ++i) {
        EXPECT_LE(restored.posterior.variance(i), answered.posterior.variance(i) + 1e-6);
    }
    EXPECT_LT((restored.posterior.mean - direct.posterior.mean).norm(), 0.5);
    EXPECT_EQ(restored.completed_vignettes, direct.completed_vignettes);

    std::vector<const Vignette*> completed;
    for (const auto& id : restored.completed_vignettes) completed.push_back(engine.find_vignette(id));
    const FisherInformationCalculator fim(LikelihoodCalculator(engine.config().temperature),
                                          engine.config().fim_regularization);
    EXPECT_LT((restored.fisher_information_matrix -
               fim.compute_cumulative_fim(completed, restored.posterior.mean)).norm(), 1e-9);
}

TEST(SessionSnapshotTest, LogPriorSurvivesRoundTrip) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    const SessionState answered = answered_session(engine);

    json j = session_to_json(answered);
    j.erase("responses");
    SessionState restored = session_from_json(j);
    const Vignette* next = engine.select_next_vignette(restored, UserContext{});
    ASSERT_NE(next, nullptr);
    engine.record_response(restored, next->vignette_id, "B");

    const json again = session_to_json(restored);
    ASSERT_TRUE(again.contains("log_prior"));
    EXPECT_EQ(again["responses"].size(), 1u);

    SessionState back = session_from_json(json::parse(again.dump()));
    ASSERT_TRUE(back.log_prior.has_value());
    EXPECT_LT((back.log_prior->mean - answered.posterior.mean).cwiseAbs().maxCoeff(), 1e-15);

    back.posterior = PreferenceEstimate{};
    engine.replay(back);
    EXPECT_LT((back.posterior.mean - restored.posterior.mean).norm(), 1e-9);
    EXPECT_EQ(back.adaptive_vignettes_shown_count, restored.adaptive_vignettes_shown_count);

    // without any answers since the restore, replay returns the persisted posterior
    SessionState untouched = session_from_json(j);
    untouched.posterior = PreferenceEstimate{};
    untouched.fisher_information_matrix.setZero();
    engine.replay(untouched);
    EXPECT_TRUE(untouched.posterior.mean.isApprox(answered.posterior.mean));
    EXPECT_LT((untouched.fisher_information_matrix - answered.fisher_information_matrix).norm(), 1e-9);
}

TEST(SessionSnapshotTest, PartialLogWithoutLogPriorRejected) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    json j = session_to_json(answered_session(engine));
    j["responses"].erase(0);

    EXPECT_NE(error_of(j).find("root.log_prior is missing"), std::string::npos);
}
