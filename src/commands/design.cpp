#include "commands/design.hpp"

#include "commands/Args.hpp"
#include "elicit/OfflineDesign.hpp"
#include "elicit/ProfileGenerator.hpp"
#include "io/JsonIO.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

int cmd_design(int argc, char** argv) {
    try {
        const std::string design_path = get_arg(argc, argv, "--design", "");
        const fs::path out_path = get_arg(argc, argv, "--out", "out/vignette_library.json");
        const int seed = get_arg_int(argc, argv, "--seed", 42);
        const int sample = get_arg_int(argc, argv, "--sample", 5000);
        const int num_static = get_arg_int(argc, argv, "--num_static", 6);
        const int num_beginning = get_arg_int(argc, argv, "--num_beginning", 4);
        const int num_library = get_arg_int(argc, argv, "--num_library", 40);
        const double diversity = get_arg_double(argc, argv, "--diversity", 0.3);

        if (sample <= 0) throw std::runtime_error("--sample must be > 0");

        elicit::ProfileGenerator generator = design_path.empty()
            ? elicit::ProfileGenerator()
            : elicit::ProfileGenerator(load_attribute_design(design_path));

        std::mt19937_64 rng(static_cast<uint64_t>(seed));
        const auto pairs = generator.generate_candidates(rng, static_cast<size_t>(sample));

        elicit::OfflineDesigner designer;
        const elicit::StaticDesign static_design = designer.select_static_design(pairs, num_static, num_beginning);

        std::vector<elicit::ProfilePair> excluded = static_design.beginning;
        excluded.insert(excluded.end(), static_design.end.begin(), static_design.end.end());

        const auto adaptive = designer.build_adaptive_library(pairs, num_library, excluded, diversity);

        elicit::VignetteConverter converter(generator);
        const elicit::VignetteLibrary lib = converter.convert_library(static_design, adaptive);
        write_vignette_library(out_path, lib);

        const elicit::DesignStatistics stats = designer.statistics(excluded);

        std::cout << "PROFILES: " << generator.total_combinations() << "\n";
        std::cout << "CANDIDATE_PAIRS: " << pairs.size() << "\n";
        std::cout << "STATIC_BEGINNING: " << lib.static_beginning.size() << "\n";
        std::cout << "STATIC_END: " << lib.static_end.size() << "\n";
        std::cout << "ADAPTIVE: " << lib.adaptive.size() << "\n";
        std::cout << "STATIC_FIM_DET: " << stats.determinant << "\n";
        std::cout << "STATIC_D_EFFICIENCY: " << stats.d_efficiency << "\n";
        std::cout << "ADAPTIVE_DIVERSITY: " << elicit::OfflineDesigner::library_diversity(adaptive) << "\n";
        std::cout << "OUT_LIBRARY: " << out_path.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "design failed: " << e.what() << "\n";
        return 1;
    }
}
