#include "commands/simulate.hpp"

#include "commands/Args.hpp"
#include "elicit/AdaptiveConfig.hpp"
#include "elicit/Likelihood.hpp"
#include "elicit/SessionState.hpp"
#include "elicit/UncertaintyAnalyzer.hpp"
#include "elicit/VignetteEngine.hpp"
#include "io/JsonIO.hpp"
#include "llm/MockVignettePersonalizer.hpp"
#include "llm/PrewarmCache.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>

namespace fs = std::filesystem;

// Respondent whose choices follow the logit model at a known preference vector.
class SimulatedRespondent {
public:
    SimulatedRespondent(elicit::FeatureVector theta, double temperature, uint64_t seed)
        : m_theta(theta), m_likelihood(temperature), m_rng(seed) {}

    std::string choose(const elicit::Vignette& v) {
        const double p_a = m_likelihood.choice_probability(
            m_theta,
            elicit::LikelihoodCalculator::extract_features(v.options[0]),
            elicit::LikelihoodCalculator::extract_features(v.options[1]));

        std::bernoulli_distribution pick_a(p_a);
        return pick_a(m_rng) ? v.options[0].option_id : v.options[1].option_id;
    }

private:
    elicit::FeatureVector m_theta;
    elicit::LikelihoodCalculator m_likelihood;
    std::mt19937_64 m_rng;
};

static void print_vector(const char* key, const elicit::FeatureVector& v) {
    std::cout << key << ":";
    for (int i = 0; i < elicit::kNumDimensions; ++i) {
        std::cout << " " << elicit::kDimensionNames[static_cast<size_t>(i)] << "=" << v[i];
    }
    std::cout << "\n";
}

int cmd_simulate(int argc, char** argv) {
    try {
        const std::string library_path = get_arg(argc, argv, "--library", "");
        if (library_path.empty()) throw std::runtime_error("--library is required");

        const std::string theta_s = get_arg(argc, argv, "--theta", "0.8,0.4,0.6,0.5,0.3,0.2,0.4");
        const int seed = get_arg_int(argc, argv, "--seed", 7);
        const std::string session_id = get_arg(argc, argv, "--session", "sim-001");
        const fs::path out_path = get_arg(argc, argv, "--out", "out/session.json");
        const std::string mock_dir = get_arg(argc, argv, "--mock_llm", "");

        elicit::UserContext ctx;
        ctx.current_role = get_arg(argc, argv, "--role", "");
        ctx.industry = get_arg(argc, argv, "--industry", "");
        ctx.experience_level = get_arg(argc, argv, "--experience", "");

        const elicit::AdaptiveConfig config = elicit::AdaptiveConfig::from_env();
        const elicit::FeatureVector theta = parse_feature_vector(theta_s, "--theta");

        elicit::VignetteEngine engine(config, load_vignette_library(library_path));
        elicit::SessionState state = elicit::SessionState::create(session_id, config);

        std::unique_ptr<llm::VignettePersonalizer> personalizer;
        if (!mock_dir.empty()) personalizer = std::make_unique<llm::MockVignettePersonalizer>(mock_dir);
        else personalizer = std::make_unique<llm::NullVignettePersonalizer>();
        llm::PrewarmCache cache(*personalizer);

        SimulatedRespondent respondent(theta, config.temperature, static_cast<uint64_t>(seed));

        std::cout << "LIBRARY: " << library_path << "\n";
        std::cout << "SESSION: " << session_id << "\n";
        std::cout << "ADAPTIVE_ENABLED: " << (config.enabled ? "true" : "false") << "\n";

        int turn = 0;
        while (const elicit::Vignette* next = engine.select_next_vignette(state, ctx)) {
            ++turn;
            const elicit::Phase phase = engine.current_phase(state);

            cache.prewarm(*next, ctx);
            const elicit::Vignette shown = cache.take(*next, ctx);

            const std::string choice = respondent.choose(shown);
            const elicit::StoppingResult stop = engine.record_response(state, shown.vignette_id, choice);

            std::cout << "TURN " << turn << ": " << shown.vignette_id
                      << " [" << elicit::to_string(phase) << "] chose " << choice
                      << " -> " << elicit::to_string(stop.decision) << " (" << stop.reason << ")\n";
        }

        const elicit::StoppingDiagnostics diag = engine.stopping_diagnostics(state);
        const elicit::UncertaintyAnalyzer analyzer(config.uncertainty_threshold);

        print_vector("TRUE_THETA", theta);
        print_vector("POSTERIOR_MEAN", state.posterior.mean);
        print_vector("POSTERIOR_VARIANCE", diag.uncertainty_per_dimension);
        std::cout << "VIGNETTES_SHOWN: " << diag.n_vignettes_shown << "\n";
        std::cout << "ADAPTIVE_SHOWN: " << state.adaptive_vignettes_shown_count << "\n";
        std::cout << "FIM_DET: " << diag.fim_determinant << "\n";
        std::cout << "MAX_VARIANCE: " << diag.max_variance << "\n";
        std::cout << "GLOBAL_UNCERTAINTY: " << analyzer.global_uncertainty(state.posterior) << "\n";

        write_session_snapshot(out_path, state);
        std::cout << "OUT_SNAPSHOT: " << out_path.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "simulate failed: " << e.what() << "\n";
        return 1;
    }
}
