#include "cli_common.hpp"
#include <common/logging.hpp>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Designs a multi-layer PCB magnetorquer coil.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  optimize    Search trace width and turn count for the largest magnetic moment\n";
    std::cerr << "  geometry    Generate the per-layer spiral layout of an optimized design\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  MAGTORQ_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "optimize") {
        return magtorq::cli::command_optimize(argc, argv);
    }
    if (command == "geometry") {
        return magtorq::cli::command_geometry(argc, argv);
    }

    magtorq::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
