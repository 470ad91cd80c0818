#include "commands/inspect.hpp"

#include "commands/Args.hpp"
#include "elicit/AdaptiveConfig.hpp"
#include "elicit/FisherInformation.hpp"
#include "elicit/StoppingCriterion.hpp"
#include "elicit/UncertaintyAnalyzer.hpp"
#include "io/JsonIO.hpp"

#include "nlohmann/json.hpp"

#include <iostream>
#include <string>

int cmd_inspect(int argc, char** argv) {
    try {
        const std::string snapshot_path = get_arg(argc, argv, "--snapshot", "");
        if (snapshot_path.empty()) throw std::runtime_error("--snapshot is required");
        const int top_k = get_arg_int(argc, argv, "--topk", 3);

        const elicit::AdaptiveConfig config = elicit::AdaptiveConfig::from_env();
        const elicit::SessionState state = read_session_snapshot(snapshot_path);

        const elicit::StoppingCriterion stopping(config.stopping_thresholds());
        const int n = static_cast<int>(state.completed_vignettes.size());
        const elicit::StoppingDiagnostics diag = stopping.diagnostics(state.posterior, state.fisher_information_matrix, n);
        const elicit::StoppingResult next = stopping.should_continue(state.posterior, state.fisher_information_matrix, n);

        const elicit::UncertaintyAnalyzer analyzer(config.uncertainty_threshold);
        const elicit::UncertaintyReport report = analyzer.report(state.posterior, top_k);

        std::cout << "SESSION: " << state.session_id << "\n";
        std::cout << "COMPLETED: " << state.completed_vignettes.size() << "\n";
        std::cout << "RESPONSES: " << state.responses.size() << "\n";
        std::cout << "ADAPTIVE_SHOWN: " << state.adaptive_vignettes_shown_count << "\n";
        std::cout << "ADAPTIVE_COMPLETE: " << (state.adaptive_phase_complete ? "true" : "false") << "\n";

        for (int i = 0; i < elicit::kNumDimensions; ++i) {
            std::cout << "THETA " << elicit::kDimensionNames[static_cast<size_t>(i)] << ": "
                      << state.posterior.mean[i] << " (var " << state.posterior.variance(i) << ")\n";
        }

        std::cout << "FIM_DET: " << diag.fim_determinant << "\n";
        std::cout << "D_EFFICIENCY: " << elicit::FisherInformationCalculator::d_efficiency(state.fisher_information_matrix) << "\n";
        std::cout << "MEETS_DET_THRESHOLD: " << (diag.meets_det_threshold ? "true" : "false") << "\n";
        std::cout << "MEETS_VARIANCE_THRESHOLD: " << (diag.meets_variance_threshold ? "true" : "false") << "\n";
        std::cout << "WITHIN_VIGNETTE_LIMITS: " << (diag.within_vignette_limits ? "true" : "false") << "\n";
        std::cout << "STOPPING: " << elicit::to_string(next.decision) << " (" << next.reason << ")\n";

        if (has_flag(argc, argv, "--json")) {
            nlohmann::json j;
            j["config"] = config.to_json();
            j["uncertainty"] = report.to_json();
            std::cout << j.dump(2) << "\n";
        } else {
            std::cout << "GLOBAL_UNCERTAINTY: " << report.global_uncertainty << "\n";
            for (const auto& d : report.most_uncertain) {
                std::cout << "UNCERTAIN: " << d.dimension << " " << d.variance << "\n";
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "inspect failed: " << e.what() << "\n";
        return 1;
    }
}
