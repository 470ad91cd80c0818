#include "commands/design.hpp"
#include "commands/inspect.hpp"
#include "commands/simulate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  pref-elicit design [args]\n"
        << "  pref-elicit simulate --library <path> [args]\n"
        << "  pref-elicit inspect --snapshot <path> [args]\n"
        << "  pref-elicit help\n";
    return 1;
}

static int print_design_help() {
    std::cerr
        << "usage:\n"
        << "  pref-elicit design [options]\n"
        << "\n"
        << "options:\n"
        << "  --design <path>              attribute design JSON, default: built-in\n"
        << "  --out <path>                 default: out/vignette_library.json\n"
        << "  --seed <n>                   default: 42\n"
        << "  --sample <n>                 candidate pairs, default: 5000\n"
        << "  --num_static <n>             default: 6\n"
        << "  --num_beginning <n>          default: 4\n"
        << "  --num_library <n>            default: 40\n"
        << "  --diversity <f>              default: 0.3\n";
    return 0;
}

static int print_simulate_help() {
    std::cerr
        << "usage:\n"
        << "  pref-elicit simulate --library <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --library <path>             (required)\n"
        << "  --theta <a,b,c,d,e,f,g>      true preferences of the simulated respondent\n"
        << "  --seed <n>                   default: 7\n"
        << "  --session <id>               default: sim-001\n"
        << "  --out <path>                 default: out/session.json\n"
        << "  --mock_llm <dir>             personalise text from <dir>/<vignette_id>.json\n"
        << "  --role <str> --industry <str> --experience <str>\n"
        << "\n"
        << "configuration is read from ELICIT_* environment variables\n";
    return 0;
}

static int print_inspect_help() {
    std::cerr
        << "usage:\n"
        << "  pref-elicit inspect --snapshot <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --topk <n>                   most uncertain dimensions, default: 3\n"
        << "  --json                       print config and uncertainty report as JSON\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "design"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_design_help();
    if (cmd == "simulate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_simulate_help();
    if (cmd == "inspect"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_inspect_help();

    if (cmd == "design")   return cmd_design(argc - 1, argv + 1);
    if (cmd == "simulate") return cmd_simulate(argc - 1, argv + 1);
    if (cmd == "inspect")  return cmd_inspect(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
