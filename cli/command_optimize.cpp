#include "cli_common.hpp"
#include <optimizer/coil_optimizer.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/design_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace magtorq::cli {

namespace {

void print_optimize_usage() {
    std::cerr << "Usage: magtorq optimize [-c constraints.json] -o <design.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config FILE    Constraint file (default: built-in sample board)\n";
    std::cerr << "  --max-power W        Override design_constraints.max_power\n";
    std::cerr << "  --threads N          Threads for the turn-count sweep (0 = all cores)\n";
    std::cerr << "  -v, --verbose        Debug logging\n";
    std::cerr << "\n";
    std::cerr << "An optional \"optimizer\" section in the constraint file configures the search.\n";
}

}  // namespace

int command_optimize(int argc, char** argv) {
    auto log = magtorq::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_optimize_usage();
            return 0;
        }
        if (ctx.output_path.empty()) {
            print_optimize_usage();
            std::cerr << "Error: -o <output> is required\n";
            return 1;
        }

        ConstraintSet constraints = ConstraintSet::sample();
        OptimizeConfig config;

        if (ctx.config_path.has_value()) {
            log->info("Loading constraints from: {}", ctx.config_path.value());
            nlohmann::json input = json::read_json_file(ctx.config_path.value());
            constraints = input.get<ConstraintSet>();
            if (input.contains("optimizer")) {
                config = input["optimizer"].get<OptimizeConfig>();
                log->info("Using optimizer config from input file");
            }
        } else {
            log->info("No constraint file given, using the sample board");
        }

        // Override with command-line arguments
        if (ctx.max_power.has_value()) {
            constraints.design.max_power = ctx.max_power.value();
        }
        if (ctx.num_threads.has_value()) {
            config.num_threads = ctx.num_threads.value();
        }

        OptimizationResult result = CoilOptimizer::optimize(constraints, config);

        json::SerializedData data;
        data.step = "optimize";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.config_path.value_or("");
        data.config = {
            {"constraints", constraints},
            {"optimizer", config}
        };
        data.stats = {
            {"status", result.status},
            {"turns_per_layer", result.design.turns},
            {"trace_width", result.design.trace_width},
            {"magnetic_moment", result.magnetic_moment},
            {"candidates", result.candidates.size()},
            {"iterations", result.iterations},
            {"evaluations", result.evaluations}
        };
        data.data = {
            {"result", result},
            {"summary", design_summary(constraints, result)}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote design to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << to_string(result.status) << ", "
                  << result.design.turns << " turns/layer, w = "
                  << result.design.trace_width * 1e3 << " mm, moment = "
                  << result.magnetic_moment << " A m^2)\n";

        if (!result.converged()) {
            log->warn("Optimization did not converge to a feasible design ({})",
                      to_string(result.status));
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace magtorq::cli
