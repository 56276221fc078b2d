#ifndef MAGTORQ_SERIALIZATION_DESIGN_JSON_HPP
#define MAGTORQ_SERIALIZATION_DESIGN_JSON_HPP

#include <nlohmann/json.hpp>
#include <coil/coil_model.hpp>
#include <optimizer/constraint_evaluator.hpp>
#include <optimizer/coil_optimizer.hpp>
#include "config_json.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace magtorq {

namespace detail {

// nlohmann writes non-finite numbers as null; read them back as +inf
inline double number_or_infinity(const nlohmann::json& j, const char* key, double fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (j[key].is_null()) {
        return std::numeric_limits<double>::infinity();
    }
    return j[key].get<double>();
}

inline double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

}  // namespace detail

NLOHMANN_JSON_SERIALIZE_ENUM(CurrentLimit, {
    {CurrentLimit::Voltage, "voltage"},
    {CurrentLimit::Thermal, "thermal"},
    {CurrentLimit::CurrentDensity, "current_density"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ThermalStatus, {
    {ThermalStatus::Converged, "converged"},
    {ThermalStatus::AboveCeiling, "above_ceiling"},
    {ThermalStatus::IterationLimit, "iteration_limit"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ResidualKind, {
    {ResidualKind::Power, "power"},
    {ResidualKind::Thermal, "thermal"},
    {ResidualKind::CurrentDensity, "current_density"},
    {ResidualKind::GeometricFit, "geometric_fit"},
    {ResidualKind::InnerClearance, "inner_clearance"},
    {ResidualKind::MinimumTurns, "minimum_turns"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OptimizationStatus, {
    {OptimizationStatus::Converged, "converged"},
    {OptimizationStatus::Infeasible, "infeasible"},
    {OptimizationStatus::BudgetExhausted, "budget_exhausted"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CandidateStatus, {
    {CandidateStatus::Converged, "converged"},
    {CandidateStatus::Infeasible, "infeasible"},
    {CandidateStatus::IterationLimit, "iteration_limit"},
    {CandidateStatus::Skipped, "skipped"},
})

// DesignPoint serialization
inline void to_json(nlohmann::json& j, const DesignPoint& p) {
    j = {
        {"trace_width", p.trace_width},
        {"turns", p.turns},
        {"copper_thickness", p.copper_thickness}
    };
}

inline void from_json(const nlohmann::json& j, DesignPoint& p) {
    p.trace_width = j.at("trace_width").get<double>();
    p.turns = j.at("turns").get<int>();
    p.copper_thickness = j.value("copper_thickness", 0.0);
}

// ThermalSolveResult serialization
inline void to_json(nlohmann::json& j, const ThermalSolveResult& r) {
    j = {
        {"status", r.status},
        {"temperature", r.temperature},
        {"ambient", r.ambient},
        {"residual", r.residual},
        {"iterations", r.iterations}
    };
}

inline void from_json(const nlohmann::json& j, ThermalSolveResult& r) {
    r.status = j.value("status", ThermalStatus::Converged);
    r.temperature = j.value("temperature", 0.0);
    r.ambient = j.value("ambient", 0.0);
    r.residual = j.value("residual", 0.0);
    r.iterations = j.value("iterations", 0);
}

// ElectroThermalState serialization
inline void to_json(nlohmann::json& j, const ElectroThermalState& s) {
    j = {
        {"trace_length", s.trace_length},
        {"resistance", s.resistance},
        {"resistance_temp", s.resistance_temp},
        {"current", s.current},
        {"current_limit", s.current_limit},
        {"power", s.power},
        {"current_density", s.current_density},
        {"ground", s.ground},
        {"space", s.space},
        {"equilibrium_temp", s.equilibrium_temp},
        {"thermal_converged", s.thermal_converged},
        {"coupling_iterations", s.coupling_iterations},
        {"winding_area", s.winding_area},
        {"magnetic_moment", s.magnetic_moment}
    };
}

inline void from_json(const nlohmann::json& j, ElectroThermalState& s) {
    s.trace_length = j.value("trace_length", 0.0);
    s.resistance = detail::number_or_infinity(j, "resistance", 0.0);
    s.resistance_temp = j.value("resistance_temp", 0.0);
    s.current = j.value("current", 0.0);
    s.current_limit = j.value("current_limit", CurrentLimit::Voltage);
    s.power = j.value("power", 0.0);
    s.current_density = j.value("current_density", 0.0);
    if (j.contains("ground")) {
        s.ground = j["ground"].get<ThermalSolveResult>();
    }
    if (j.contains("space")) {
        s.space = j["space"].get<ThermalSolveResult>();
    }
    s.equilibrium_temp = j.value("equilibrium_temp", 0.0);
    s.thermal_converged = j.value("thermal_converged", true);
    s.coupling_iterations = j.value("coupling_iterations", 0);
    s.winding_area = j.value("winding_area", 0.0);
    s.magnetic_moment = j.value("magnetic_moment", 0.0);
}

// ConstraintResidual serialization
inline void to_json(nlohmann::json& j, const ConstraintResidual& r) {
    j = {
        {"kind", r.kind},
        {"name", r.name},
        {"value", r.value},
        {"scale", r.scale},
        {"diverged", r.diverged}
    };
}

inline void from_json(const nlohmann::json& j, ConstraintResidual& r) {
    r.kind = j.at("kind").get<ResidualKind>();
    r.name = j.at("name").get<std::string>();
    r.value = j.at("value").get<double>();
    r.scale = j.value("scale", 1.0);
    r.diverged = j.value("diverged", false);
}

inline void to_json(nlohmann::json& j, const ResidualSet& set) {
    j = set.residuals;
}

inline void from_json(const nlohmann::json& j, ResidualSet& set) {
    set.residuals = j.get<std::vector<ConstraintResidual>>();
}

// CandidateSummary serialization
inline void to_json(nlohmann::json& j, const CandidateSummary& c) {
    j = {
        {"turns", c.turns},
        {"width_min", c.width_min},
        {"width_max", c.width_max},
        {"trace_width", c.trace_width},
        {"magnetic_moment", c.magnetic_moment},
        {"max_violation", c.max_violation},
        {"iterations", c.iterations},
        {"evaluations", c.evaluations},
        {"status", c.status}
    };
}

inline void from_json(const nlohmann::json& j, CandidateSummary& c) {
    c.turns = j.at("turns").get<int>();
    c.width_min = j.value("width_min", 0.0);
    c.width_max = j.value("width_max", 0.0);
    c.trace_width = j.value("trace_width", 0.0);
    c.magnetic_moment = j.value("magnetic_moment", 0.0);
    c.max_violation = j.value("max_violation", 0.0);
    c.iterations = j.value("iterations", 0);
    c.evaluations = j.value("evaluations", 0);
    c.status = j.value("status", CandidateStatus::Skipped);
}

// CoilDynamics serialization
inline void to_json(nlohmann::json& j, const CoilDynamics& d) {
    j = {
        {"inductance", d.inductance},
        {"time_constant", d.time_constant},
        {"time_to_99_percent", d.time_to_99_percent}
    };
}

inline void from_json(const nlohmann::json& j, CoilDynamics& d) {
    d.inductance = j.value("inductance", 0.0);
    d.time_constant = j.value("time_constant", 0.0);
    d.time_to_99_percent = j.value("time_to_99_percent", 0.0);
}

// OptimizationResult serialization, full precision
inline void to_json(nlohmann::json& j, const OptimizationResult& r) {
    j = {
        {"design", r.design},
        {"state", r.state},
        {"magnetic_moment", r.magnetic_moment},
        {"residuals", r.residuals},
        {"status", r.status},
        {"seed", r.seed},
        {"iterations", r.iterations},
        {"evaluations", r.evaluations},
        {"candidates", r.candidates},
        {"dynamics", r.dynamics}
    };
}

inline void from_json(const nlohmann::json& j, OptimizationResult& r) {
    r.design = j.at("design").get<DesignPoint>();
    if (j.contains("state")) {
        r.state = j["state"].get<ElectroThermalState>();
    }
    r.magnetic_moment = j.value("magnetic_moment", 0.0);
    if (j.contains("residuals")) {
        r.residuals = j["residuals"].get<ResidualSet>();
    }
    r.status = j.at("status").get<OptimizationStatus>();
    if (j.contains("seed")) {
        r.seed = j["seed"].get<DesignPoint>();
    }
    r.iterations = j.value("iterations", 0);
    r.evaluations = j.value("evaluations", 0);
    if (j.contains("candidates")) {
        r.candidates = j["candidates"].get<std::vector<CandidateSummary>>();
    }
    if (j.contains("dynamics")) {
        r.dynamics = j["dynamics"].get<CoilDynamics>();
    }
}

// Rounded design record in display units (mm, Ohm, A, W, A/mm^2, C, uH, ms, A m^2)
inline nlohmann::json design_summary(const ConstraintSet& c, const OptimizationResult& r) {
    using detail::round_to;
    const auto& s = r.state;

    nlohmann::json thermal;
    for (const auto* mode : {&s.ground, &s.space}) {
        nlohmann::json entry = {
            {"ambient", round_to(mode->ambient, 2)},
            {"temperature_rise", round_to(mode->temperature_rise(), 2)},
            {"final_temperature", round_to(mode->temperature, 2)},
            {"status", mode->status}
        };
        thermal[mode == &s.ground ? "ground" : "space"] = entry;
    }

    return {
        {"dimensions", {
            {"inner", {
                {"length", round_to(c.design.inner_length * 1e3, 1)},
                {"width", round_to(c.design.inner_width * 1e3, 1)}
            }},
            {"outer", {
                {"length", round_to(c.design.outer_length * 1e3, 1)},
                {"width", round_to(c.design.outer_width * 1e3, 1)}
            }}
        }},
        {"traces", {
            {"width", round_to(r.design.trace_width * 1e3, 3)},
            {"spacing", round_to(c.manufacturing.min_trace_spacing * 1e3, 3)},
            {"turns_per_layer", r.design.turns},
            {"total_layers", c.design.num_layers},
            {"total_length", round_to(s.trace_length, 1)}
        }},
        {"electrical", {
            {"resistance", round_to(s.resistance, 2)},
            {"voltage", round_to(c.design.voltage, 2)},
            {"current", round_to(s.current, 4)},
            {"current_limit", s.current_limit},
            {"power", round_to(s.power, 4)},
            {"current_density", round_to(s.current_density / 1e6, 2)}
        }},
        {"thermal", thermal},
        {"dynamics", {
            {"inductance", round_to(r.dynamics.inductance * 1e6, 3)},
            {"time_constant", round_to(r.dynamics.time_constant * 1e3, 4)},
            {"time_to_99_percent", round_to(r.dynamics.time_to_99_percent * 1e3, 4)}
        }},
        {"performance", {
            {"magnetic_moment", round_to(r.magnetic_moment, 4)},
            {"status", r.status}
        }}
    };
}

}  // namespace magtorq

#endif // MAGTORQ_SERIALIZATION_DESIGN_JSON_HPP
