#ifndef MAGTORQ_SERIALIZATION_CONFIG_JSON_HPP
#define MAGTORQ_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <coil/constraint_set.hpp>
#include <coil/coil_model.hpp>
#include <thermal/thermal_solver.hpp>
#include <optimizer/coil_optimizer.hpp>

namespace magtorq {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

// Missing keys fall back to the sample constraint set

inline void to_json(nlohmann::json& j, const PhysicalConstants& c) {
    j = {
        {"vacuum_permeability", c.vacuum_permeability},
        {"copper_resistivity", c.copper_resistivity},
        {"temperature_coefficient", c.temperature_coefficient},
        {"reference_temp", c.reference_temp},
        {"oz_to_m", c.oz_to_m},
        {"current_density_limit", c.current_density_limit}
    };
}

inline void from_json(const nlohmann::json& j, PhysicalConstants& c) {
    const PhysicalConstants defaults;
    c.vacuum_permeability = j.value("vacuum_permeability", defaults.vacuum_permeability);
    c.copper_resistivity = j.value("copper_resistivity", defaults.copper_resistivity);
    c.temperature_coefficient = j.value("temperature_coefficient", defaults.temperature_coefficient);
    c.reference_temp = j.value("reference_temp", defaults.reference_temp);
    c.oz_to_m = j.value("oz_to_m", defaults.oz_to_m);
    c.current_density_limit = j.value("current_density_limit", defaults.current_density_limit);
}

inline void to_json(nlohmann::json& j, const ThermalProperties& t) {
    j = {
        {"thermal_conductivity_copper", t.thermal_conductivity_copper},
        {"thermal_conductivity_fr4", t.thermal_conductivity_fr4},
        {"fr4_thickness", t.fr4_thickness},
        {"surface_area_multiplier", t.surface_area_multiplier},
        {"emissivity", t.emissivity},
        {"ground_convection_coefficient", t.ground_convection_coefficient},
        {"space_ambient_temp", t.space_ambient_temp},
        {"max_equilibrium_temp", t.max_equilibrium_temp}
    };
}

inline void from_json(const nlohmann::json& j, ThermalProperties& t) {
    const ThermalProperties defaults;
    t.thermal_conductivity_copper = j.value("thermal_conductivity_copper", defaults.thermal_conductivity_copper);
    t.thermal_conductivity_fr4 = j.value("thermal_conductivity_fr4", defaults.thermal_conductivity_fr4);
    t.fr4_thickness = j.value("fr4_thickness", defaults.fr4_thickness);
    t.surface_area_multiplier = j.value("surface_area_multiplier", defaults.surface_area_multiplier);
    t.emissivity = j.value("emissivity", defaults.emissivity);
    t.ground_convection_coefficient = j.value("ground_convection_coefficient",
                                              defaults.ground_convection_coefficient);
    t.space_ambient_temp = j.value("space_ambient_temp", defaults.space_ambient_temp);
    t.max_equilibrium_temp = j.value("max_equilibrium_temp", defaults.max_equilibrium_temp);
}

inline void to_json(nlohmann::json& j, const DesignConstraints& d) {
    j = {
        {"num_layers", d.num_layers},
        {"copper_weight", d.copper_weight},
        {"max_power", d.max_power},
        {"voltage", d.voltage},
        {"inner_length", d.inner_length},
        {"inner_width", d.inner_width},
        {"outer_length", d.outer_length},
        {"outer_width", d.outer_width},
        {"operating_temp", d.operating_temp},
        {"ambient_temp", d.ambient_temp}
    };
}

inline void from_json(const nlohmann::json& j, DesignConstraints& d) {
    const DesignConstraints defaults;
    d.num_layers = j.value("num_layers", defaults.num_layers);
    d.copper_weight = j.value("copper_weight", defaults.copper_weight);
    d.max_power = j.value("max_power", defaults.max_power);
    d.voltage = j.value("voltage", defaults.voltage);
    d.inner_length = j.value("inner_length", defaults.inner_length);
    d.inner_width = j.value("inner_width", defaults.inner_width);
    d.outer_length = j.value("outer_length", defaults.outer_length);
    d.outer_width = j.value("outer_width", defaults.outer_width);
    d.operating_temp = j.value("operating_temp", defaults.operating_temp);
    d.ambient_temp = j.value("ambient_temp", defaults.ambient_temp);
}

inline void to_json(nlohmann::json& j, const ManufacturingConstraints& m) {
    j = {
        {"min_trace_width", m.min_trace_width},
        {"max_trace_width", m.max_trace_width},
        {"min_trace_spacing", m.min_trace_spacing},
        {"via_drill", m.via_drill},
        {"via_pad_diameter", m.via_pad_diameter},
        {"inner_clearance", m.inner_clearance}
    };
}

inline void from_json(const nlohmann::json& j, ManufacturingConstraints& m) {
    const ManufacturingConstraints defaults;
    m.min_trace_width = j.value("min_trace_width", defaults.min_trace_width);
    m.max_trace_width = j.value("max_trace_width", defaults.max_trace_width);
    m.min_trace_spacing = j.value("min_trace_spacing", defaults.min_trace_spacing);
    m.via_drill = j.value("via_drill", defaults.via_drill);
    m.via_pad_diameter = j.value("via_pad_diameter", defaults.via_pad_diameter);
    m.inner_clearance = j.value("inner_clearance", defaults.inner_clearance);
}

// ConstraintSet, laid out like the constraint file
inline void to_json(nlohmann::json& j, const ConstraintSet& c) {
    j = {
        {"physical_constants", c.physical},
        {"thermal_properties", c.thermal},
        {"design_constraints", c.design},
        {"manufacturing_constraints", c.manufacturing}
    };
}

inline void from_json(const nlohmann::json& j, ConstraintSet& c) {
    c = ConstraintSet::sample();
    if (j.contains("physical_constants")) {
        c.physical = j["physical_constants"].get<PhysicalConstants>();
    }
    if (j.contains("thermal_properties")) {
        c.thermal = j["thermal_properties"].get<ThermalProperties>();
    }
    if (j.contains("design_constraints")) {
        c.design = j["design_constraints"].get<DesignConstraints>();
    }
    if (j.contains("manufacturing_constraints")) {
        c.manufacturing = j["manufacturing_constraints"].get<ManufacturingConstraints>();
    }
}

NLOHMANN_JSON_SERIALIZE_ENUM(ThermalPolicy, {
    {ThermalPolicy::BothModes, "both_modes"},
    {ThermalPolicy::WorstCase, "worst_case"},
    {ThermalPolicy::GroundOnly, "ground_only"},
    {ThermalPolicy::SpaceOnly, "space_only"},
})

inline void to_json(nlohmann::json& j, const ThermalSolveConfig& config) {
    j = {
        {"tolerance", config.tolerance},
        {"max_iterations", config.max_iterations}
    };
}

inline void from_json(const nlohmann::json& j, ThermalSolveConfig& config) {
    const ThermalSolveConfig defaults;
    config.tolerance = j.value("tolerance", defaults.tolerance);
    config.max_iterations = j.value("max_iterations", defaults.max_iterations);
}

inline void to_json(nlohmann::json& j, const ModelConfig& config) {
    j = {
        {"thermal_policy", config.thermal_policy},
        {"self_consistent_resistance", config.self_consistent_resistance},
        {"max_coupling_iterations", config.max_coupling_iterations},
        {"coupling_tolerance", config.coupling_tolerance},
        {"thermal", config.thermal}
    };
}

inline void from_json(const nlohmann::json& j, ModelConfig& config) {
    const ModelConfig defaults;
    config.thermal_policy = j.value("thermal_policy", defaults.thermal_policy);
    config.self_consistent_resistance = j.value("self_consistent_resistance",
                                                defaults.self_consistent_resistance);
    config.max_coupling_iterations = j.value("max_coupling_iterations",
                                             defaults.max_coupling_iterations);
    config.coupling_tolerance = j.value("coupling_tolerance", defaults.coupling_tolerance);
    if (j.contains("thermal")) {
        config.thermal = j["thermal"].get<ThermalSolveConfig>();
    }
}

// OptimizeConfig serialization (without step_callback)
inline void to_json(nlohmann::json& j, const OptimizeConfig& config) {
    j = {
        {"max_iterations", config.max_iterations},
        {"objective_tolerance", config.objective_tolerance},
        {"step_tolerance", config.step_tolerance},
        {"constraint_tolerance", config.constraint_tolerance},
        {"stall_iterations", config.stall_iterations},
        {"fd_step", config.fd_step},
        {"initial_step", config.initial_step},
        {"max_step", config.max_step},
        {"min_step", config.min_step},
        {"step_growth", config.step_growth},
        {"time_budget_ms", config.time_budget_ms},
        {"num_threads", config.num_threads},
        {"model", config.model}
    };
}

inline void from_json(const nlohmann::json& j, OptimizeConfig& config) {
    const OptimizeConfig defaults;
    config.max_iterations = j.value("max_iterations", defaults.max_iterations);
    config.objective_tolerance = j.value("objective_tolerance", defaults.objective_tolerance);
    config.step_tolerance = j.value("step_tolerance", defaults.step_tolerance);
    config.constraint_tolerance = j.value("constraint_tolerance", defaults.constraint_tolerance);
    config.stall_iterations = j.value("stall_iterations", defaults.stall_iterations);
    config.fd_step = j.value("fd_step", defaults.fd_step);
    config.initial_step = j.value("initial_step", defaults.initial_step);
    config.max_step = j.value("max_step", defaults.max_step);
    config.min_step = j.value("min_step", defaults.min_step);
    config.step_growth = j.value("step_growth", defaults.step_growth);
    config.time_budget_ms = j.value("time_budget_ms", defaults.time_budget_ms);
    config.num_threads = j.value("num_threads", defaults.num_threads);
    if (j.contains("model")) {
        config.model = j["model"].get<ModelConfig>();
    }
    // Note: step_callback cannot be serialized
}

}  // namespace magtorq

#endif // MAGTORQ_SERIALIZATION_CONFIG_JSON_HPP
