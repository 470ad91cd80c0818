/**
 * @file test_vignette_engine.cpp
 * @brief Phase orchestration, response recording and session invariants
 */

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "elicit/VignetteEngine.hpp"
#include "TestVignettes.hpp"

using namespace elicit;

namespace {

// Runs a session to exhaustion, always choosing option A. Returns the ids in display order.
std::vector<std::string> run_to_end(const VignetteEngine& engine, SessionState& s) {
    const UserContext ctx;
    std::vector<std::string> shown;
    for (int guard = 0; guard < 100; ++guard) {
        const Vignette* v = engine.select_next_vignette(s, ctx);
        if (!v) break;
        shown.push_back(v->vignette_id);
        engine.record_response(s, v->vignette_id, "A");
    }
    return shown;
}

}  // namespace

TEST(VignetteEngineTest, StaticBeginningIsShownInOrder) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());
    const UserContext ctx;

    EXPECT_EQ(engine.current_phase(s), Phase::StaticBeginning);
    for (int i = 1; i <= 4; ++i) {
        const Vignette* v = engine.select_next_vignette(s, ctx);
        ASSERT_NE(v, nullptr);
        EXPECT_EQ(v->vignette_id, testutil::numbered("static_begin_", i));

        // asking again without answering returns the same vignette
        EXPECT_EQ(engine.select_next_vignette(s, ctx), v);

        const StoppingResult r = engine.record_response(s, v->vignette_id, "A");
        if (i < 4) {
            EXPECT_TRUE(r.should_continue);
            EXPECT_EQ(r.reason, "static beginning in progress");
        }
    }
    EXPECT_EQ(engine.current_phase(s), Phase::Adaptive);
    EXPECT_EQ(s.adaptive_vignettes_shown_count, 0);
}

TEST(VignetteEngineTest, FullSessionNeverRepeatsAndEndsWithStaticEnd) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    const std::vector<std::string> shown = run_to_end(engine, s);

    const std::set<std::string> unique(shown.begin(), shown.end());
    EXPECT_EQ(unique.size(), shown.size());
    EXPECT_EQ(s.completed_vignettes, shown);

    ASSERT_GE(shown.size(), 7u);
    EXPECT_EQ(shown[shown.size() - 2], "static_end_001");
    EXPECT_EQ(shown.back(), "static_end_002");

    EXPECT_TRUE(s.adaptive_phase_complete);
    EXPECT_GE(s.adaptive_vignettes_shown_count, 1);
    EXPECT_LE(s.adaptive_vignettes_shown_count, 8);
    EXPECT_EQ(static_cast<size_t>(s.adaptive_vignettes_shown_count), shown.size() - 6);
    EXPECT_EQ(engine.current_phase(s), Phase::Complete);

    EXPECT_EQ(engine.select_next_vignette(s, UserContext{}), nullptr);
}

TEST(VignetteEngineTest, BayesianSelectionRunsAFullSession) {
    AdaptiveConfig cfg;
    cfg.bayesian_selection = true;
    VignetteEngine engine(cfg, testutil::make_library());
    EXPECT_EQ(engine.optimizer().mode(), SelectionMode::Bayesian);
    SessionState s = SessionState::create("s", engine.config());

    const std::vector<std::string> shown = run_to_end(engine, s);

    const std::set<std::string> unique(shown.begin(), shown.end());
    EXPECT_EQ(unique.size(), shown.size());
    ASSERT_GE(shown.size(), 7u);
    EXPECT_EQ(shown.back(), "static_end_002");
    EXPECT_GE(s.adaptive_vignettes_shown_count, 1);
    EXPECT_EQ(engine.current_phase(s), Phase::Complete);
}

TEST(VignetteEngineTest, ChoosingWageRaisesItsWeight) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    for (int i = 1; i <= 4; ++i) engine.record_response(s, testutil::numbered("static_begin_", i), "A");

    EXPECT_GT(s.posterior.mean[0], 0.0);
    for (int j = 1; j <= 4; ++j) EXPECT_LT(s.posterior.mean[j], 0.0);
    EXPECT_LT(s.posterior.variance(0), 1.0);
    EXPECT_FALSE(s.fisher_information_matrix.isZero());
}

TEST(VignetteEngineTest, StopIsStickyAtMaximum) {
    AdaptiveConfig cfg;
    cfg.max_vignettes = 5;
    VignetteEngine engine(cfg, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());
    const UserContext ctx;

    for (int i = 1; i <= 4; ++i) engine.record_response(s, testutil::numbered("static_begin_", i), "A");

    const Vignette* v = engine.select_next_vignette(s, ctx);
    ASSERT_NE(v, nullptr);
    EXPECT_TRUE(engine.is_adaptive(v->vignette_id));

    const StoppingResult r = engine.record_response(s, v->vignette_id, "B");
    EXPECT_FALSE(r.should_continue);
    EXPECT_EQ(r.decision, StoppingDecision::Stop);
    EXPECT_NE(r.reason.find("maximum"), std::string::npos);
    EXPECT_TRUE(s.adaptive_phase_complete);
    EXPECT_EQ(s.adaptive_vignettes_shown_count, 1);

    const Vignette* end = engine.select_next_vignette(s, ctx);
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(end->vignette_id, "static_end_001");

    const StoppingResult after = engine.record_response(s, end->vignette_id, "A");
    EXPECT_EQ(after.reason, "adaptive phase complete");
    EXPECT_TRUE(s.adaptive_phase_complete);
}

TEST(VignetteEngineTest, DisabledSkipsAdaptivePhase) {
    AdaptiveConfig cfg;
    cfg.enabled = false;
    VignetteEngine engine(cfg, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    const std::vector<std::string> shown = run_to_end(engine, s);
    ASSERT_EQ(shown.size(), 6u);
    EXPECT_EQ(shown[4], "static_end_001");
    EXPECT_EQ(s.adaptive_vignettes_shown_count, 0);

    SessionState fresh = SessionState::create("t", engine.config());
    EXPECT_EQ(engine.record_response(fresh, "static_begin_001", "A").reason, "adaptive phase disabled");
}

TEST(VignetteEngineTest, EmptyAdaptivePoolEndsThePhase) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library(0));
    SessionState s = SessionState::create("s", engine.config());

    const std::vector<std::string> shown = run_to_end(engine, s);
    ASSERT_EQ(shown.size(), 6u);
    EXPECT_EQ(shown[4], "static_end_001");
    EXPECT_TRUE(s.adaptive_phase_complete);
}

TEST(VignetteEngineTest, DominatedAdaptiveVignettesAreNeverOffered) {
    VignetteLibrary lib = testutil::make_library(2);
    lib.adaptive.insert(lib.adaptive.begin(), testutil::dominated("adaptive_dom"));

    VignetteEngine engine(AdaptiveConfig{}, lib);
    const auto pool = engine.adaptive_candidates();
    ASSERT_EQ(pool.size(), 2u);
    for (const Vignette* v : pool) EXPECT_NE(v->vignette_id, "adaptive_dom");

    SessionState s = SessionState::create("s", engine.config());
    const std::vector<std::string> shown = run_to_end(engine, s);
    for (const auto& id : shown) EXPECT_NE(id, "adaptive_dom");
}

TEST(VignetteEngineTest, LibraryIdsMustBeUnique) {
    VignetteLibrary lib = testutil::make_library(2);
    lib.static_end.push_back(testutil::tradeoff("adaptive_001", 1, 2));
    EXPECT_THROW({ VignetteEngine engine(AdaptiveConfig{}, lib); }, std::invalid_argument);

    VignetteLibrary same_options = testutil::make_library(2);
    same_options.adaptive[0].options[1].option_id = "A";
    EXPECT_THROW({ VignetteEngine engine(AdaptiveConfig{}, same_options); }, std::invalid_argument);
}

TEST(VignetteEngineTest, OptionsMustEncodeDifferently) {
    VignetteLibrary lib = testutil::make_library(2);
    lib.adaptive.push_back(testutil::make_vignette("adaptive_flat", {{"wage", 20000.0}}, {{"salary", 20000.0}}));
    try {
        VignetteEngine engine(AdaptiveConfig{}, lib);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("adaptive_flat"), std::string::npos);
    }

    VignetteLibrary static_flat = testutil::make_library(2);
    static_flat.static_end[0].options[1].attributes = static_flat.static_end[0].options[0].attributes;
    EXPECT_THROW({ VignetteEngine engine(AdaptiveConfig{}, static_flat); }, std::invalid_argument);
}

TEST(VignetteEngineTest, InvalidConfigIsRejected) {
    AdaptiveConfig cfg;
    cfg.min_vignettes = 10;
    cfg.max_vignettes = 5;
    EXPECT_THROW({ VignetteEngine engine(cfg, testutil::make_library()); }, ConfigError);
}

TEST(VignetteEngineTest, SelectingACompletedVignetteIsALogicError) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    // one static vignette done, but not the first: the positional pick collides
    s.mark_completed("static_begin_002");
    EXPECT_THROW(engine.select_next_vignette(s, UserContext{}), std::logic_error);
}

TEST(VignetteEngineTest, RecordResponseValidatesInput) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    EXPECT_THROW(engine.record_response(s, "nope", "A"), std::invalid_argument);
    EXPECT_THROW(engine.record_response(s, "static_begin_001", "C"), std::invalid_argument);
    EXPECT_TRUE(s.completed_vignettes.empty());
    EXPECT_TRUE(s.responses.empty());

    s.mark_completed("static_begin_003");
    EXPECT_THROW(engine.record_response(s, "static_begin_003", "A"), std::logic_error);
}

TEST(VignetteEngineTest, RepeatedResponseIsIdempotent) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());

    engine.record_response(s, "static_begin_001", "B");
    const FeatureVector mean = s.posterior.mean;
    const InformationMatrix fim = s.fisher_information_matrix;

    engine.record_response(s, "static_begin_001", "B");
    EXPECT_EQ(s.responses.size(), 1u);
    EXPECT_EQ(s.completed_vignettes.size(), 1u);
    EXPECT_TRUE(s.posterior.mean.isApprox(mean));
    EXPECT_TRUE(s.fisher_information_matrix.isApprox(fim));

    EXPECT_THROW(engine.record_response(s, "static_begin_001", "A"), std::logic_error);
    EXPECT_EQ(s.responses.size(), 1u);
}

TEST(VignetteEngineTest, ReplayRebuildsDerivedState) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());
    run_to_end(engine, s);

    SessionState copy = SessionState::create("s", engine.config());
    copy.responses = s.responses;
    copy.adaptive_phase_complete = s.adaptive_phase_complete;
    engine.replay(copy);

    EXPECT_EQ(copy.completed_vignettes, s.completed_vignettes);
    EXPECT_EQ(copy.adaptive_vignettes_shown_count, s.adaptive_vignettes_shown_count);
    EXPECT_LT((copy.posterior.mean - s.posterior.mean).norm(), 1e-9);
    EXPECT_LT((copy.fisher_information_matrix - s.fisher_information_matrix).norm(), 1e-9);

    SessionState empty = SessionState::create("e", engine.config());
    empty.posterior.mean.setOnes();
    engine.replay(empty);
    EXPECT_TRUE(empty.posterior.mean.isZero());
}

TEST(VignetteEngineTest, StoppingDiagnosticsCountCompleted) {
    VignetteEngine engine(AdaptiveConfig{}, testutil::make_library());
    SessionState s = SessionState::create("s", engine.config());
    engine.record_response(s, "static_begin_001", "A");
    engine.record_response(s, "static_begin_002", "B");

    const StoppingDiagnostics d = engine.stopping_diagnostics(s);
    EXPECT_EQ(d.n_vignettes_shown, 2);
    EXPECT_FALSE(d.within_vignette_limits);
    EXPECT_DOUBLE_EQ(d.max_variance, s.posterior.max_variance());
}
