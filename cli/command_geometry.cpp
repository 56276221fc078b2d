#include "cli_common.hpp"
#include <geometry/spiral_builder.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/design_json.hpp>
#include <serialization/layout_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace magtorq::cli {

int command_geometry(int argc, char** argv) {
    auto log = magtorq::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: magtorq geometry <design.json> [-o <layout.json>]\n";
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".layout.json",
                                                      ctx.output_path);

        log->info("Building layout from: {}", ctx.input_path);

        // Load the design record written by the optimize command
        json::SerializedData input_data = json::read_serialized(ctx.input_path, "optimize");
        if (input_data.config.is_null() || !input_data.config.contains("constraints")) {
            log->error("Design file missing constraints in config");
            return 1;
        }

        ConstraintSet constraints = input_data.config["constraints"].get<ConstraintSet>();
        OptimizationResult result = input_data.data.at("result").get<OptimizationResult>();

        OptimizeConfig optimize_config;
        if (input_data.config.contains("optimizer")) {
            optimize_config = input_data.config["optimizer"].get<OptimizeConfig>();
        }

        if (!result.feasible(optimize_config.constraint_tolerance)) {
            log->error("Design in {} is {} with max violation {:.3e}, no layout generated",
                       ctx.input_path, to_string(result.status),
                       result.residuals.max_violation());
            return 1;
        }

        CoilLayout layout = build_layout(constraints, result);

        ValidationResult validation = layout.validate(constraints);
        for (const auto& warning : validation.warnings) {
            log->warn("Layout: {}", warning);
        }
        if (!validation.valid) {
            log->error("Generated layout is invalid: {}", validation.error_summary());
            return 1;
        }

        auto [min_pt, max_pt] = layout.bounding_box();

        json::SerializedData data;
        data.step = "geometry";
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;

        // Carry forward configuration
        data.config = {
            {"constraints", constraints},
            {"design", result.design}
        };

        data.data = coil_layout_to_json(layout);
        data.stats = {
            {"winding_layers", layout.layer_count()},
            {"turns_per_layer", layout.turns_per_layer()},
            {"transitions", layout.transitions().size()},
            {"total_trace_length", layout.total_trace_length()},
            {"bounding_box", {min_pt, max_pt}}
        };

        json::write_serialized(output_path, data);

        log->info("Wrote layout to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << layout.layer_count() << " layers, "
                  << layout.turns_per_layer() << " turns/layer, "
                  << "trace length: " << layout.total_trace_length() << " m)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace magtorq::cli
