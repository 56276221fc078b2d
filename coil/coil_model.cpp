#include "coil_model.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace magtorq {

const char* to_string(CurrentLimit limit) {
    switch (limit) {
        case CurrentLimit::Voltage: return "voltage";
        case CurrentLimit::Thermal: return "thermal";
        case CurrentLimit::CurrentDensity: return "current_density";
    }
    return "unknown";
}

const char* to_string(ThermalPolicy policy) {
    switch (policy) {
        case ThermalPolicy::BothModes: return "both_modes";
        case ThermalPolicy::WorstCase: return "worst_case";
        case ThermalPolicy::GroundOnly: return "ground_only";
        case ThermalPolicy::SpaceOnly: return "space_only";
    }
    return "unknown";
}

CoilModel::CoilModel(const ConstraintSet& constraints, const ModelConfig& config)
    : constraints_(constraints)
    , config_(config) {}

double CoilModel::turn_pitch(double trace_width) const {
    return trace_width + constraints_.manufacturing.min_trace_spacing;
}

double CoilModel::lane_width(double trace_width) const {
    return std::max(trace_width, constraints_.manufacturing.via_pad_diameter);
}

double CoilModel::inner_keepout(double trace_width) const {
    // Room for the inner lead and its transition pad, with spacing on both
    // sides, between the innermost turn and the cutout
    const auto& m = constraints_.manufacturing;
    return lane_width(trace_width) + 2.0 * m.min_trace_spacing + m.inner_clearance;
}

double CoilModel::half_span_length() const {
    return (constraints_.design.outer_length - constraints_.design.inner_length) / 2.0;
}

double CoilModel::half_span_width() const {
    return (constraints_.design.outer_width - constraints_.design.inner_width) / 2.0;
}

int CoilModel::turns_for_span(double half_span, double trace_width) const {
    if (!(trace_width > 0.0)) {
        return 0;
    }

    // n traces and n-1 gaps occupy n*p - s; the rest must cover the keep-out
    double spacing = constraints_.manufacturing.min_trace_spacing;
    double available = half_span - inner_keepout(trace_width) + spacing;
    if (available <= 0.0) {
        return 0;
    }
    return static_cast<int>(std::floor(available / turn_pitch(trace_width)));
}

int CoilModel::turn_count(double trace_width) const {
    return std::min(turns_for_span(half_span_length(), trace_width),
                    turns_for_span(half_span_width(), trace_width));
}

TurnRect CoilModel::turn_rect(int turn, double trace_width) const {
    double offset = trace_width / 2.0 + turn * turn_pitch(trace_width);
    TurnRect rect;
    rect.half_length = constraints_.design.outer_length / 2.0 - offset;
    rect.half_width = constraints_.design.outer_width / 2.0 - offset;
    return rect;
}

double CoilModel::innermost_gap(double half_span, int turns, double trace_width) const {
    double band = turns * turn_pitch(trace_width) - constraints_.manufacturing.min_trace_spacing;
    return half_span - band;
}

double CoilModel::total_trace_length(double trace_width, int turns) const {
    double per_layer = 0.0;
    for (int k = 0; k < turns; ++k) {
        per_layer += turn_rect(k, trace_width).perimeter();
    }
    return per_layer * constraints_.winding_layers();
}

double CoilModel::winding_area(double trace_width, int turns) const {
    double area = 0.0;
    for (int k = 0; k < turns; ++k) {
        area += turn_rect(k, trace_width).area();
    }
    return area;
}

DesignPoint CoilModel::design_point(double trace_width) const {
    DesignPoint point;
    point.trace_width = trace_width;
    point.turns = turn_count(trace_width);
    point.copper_thickness = constraints_.copper_thickness();
    return point;
}

double CoilModel::resistance(double trace_length, double trace_width, double temperature) const {
    const auto& phys = constraints_.physical;
    double cross_section = trace_width * constraints_.copper_thickness();
    if (!(cross_section > 0.0)) {
        return std::numeric_limits<double>::infinity();
    }
    double rho = phys.copper_resistivity *
                 (1.0 + phys.temperature_coefficient * (temperature - phys.reference_temp));
    return rho * trace_length / cross_section;
}

double CoilModel::current_density_limit_current(double trace_width) const {
    return constraints_.physical.current_density_limit * trace_width *
           constraints_.copper_thickness();
}

std::vector<ThermalMode> CoilModel::enforced_modes() const {
    switch (config_.thermal_policy) {
        case ThermalPolicy::GroundOnly: return {ThermalMode::Ground};
        case ThermalPolicy::SpaceOnly: return {ThermalMode::Space};
        case ThermalPolicy::BothModes:
        case ThermalPolicy::WorstCase:
            break;
    }
    return {ThermalMode::Ground, ThermalMode::Space};
}

double CoilModel::thermal_power_limit() const {
    double limit = std::numeric_limits<double>::infinity();
    for (ThermalMode mode : enforced_modes()) {
        limit = std::min(limit, ThermalSolver::max_power(
            constraints_, constraints_.design.operating_temp, mode));
    }
    return limit;
}

ElectroThermalState CoilModel::evaluate(const DesignPoint& point) const {
    ElectroThermalState state;
    state.resistance_temp = constraints_.design.operating_temp;

    if (point.turns < 1 || !(point.trace_width > 0.0)) {
        state.resistance = std::numeric_limits<double>::infinity();
        state.ground.ambient = ThermalSolver::ambient_temp(constraints_, ThermalMode::Ground);
        state.ground.temperature = state.ground.ambient;
        state.space.ambient = ThermalSolver::ambient_temp(constraints_, ThermalMode::Space);
        state.space.temperature = state.space.ambient;
        state.equilibrium_temp = std::max(state.ground.temperature, state.space.temperature);
        return state;
    }

    const auto& d = constraints_.design;
    double cross_section = point.trace_width * point.copper_thickness;

    state.trace_length = total_trace_length(point.trace_width, point.turns);
    state.winding_area = winding_area(point.trace_width, point.turns);

    double thermal_power = thermal_power_limit();
    double density_current = current_density_limit_current(point.trace_width);
    std::vector<ThermalMode> modes = enforced_modes();

    int max_passes = config_.self_consistent_resistance ? config_.max_coupling_iterations : 1;
    for (int pass = 0; pass < max_passes; ++pass) {
        state.coupling_iterations = pass + 1;
        state.resistance = resistance(state.trace_length, point.trace_width, state.resistance_temp);

        double voltage_current = d.voltage / state.resistance;
        double thermal_current = std::sqrt(thermal_power / state.resistance);

        state.current = voltage_current;
        state.current_limit = CurrentLimit::Voltage;
        if (thermal_current < state.current) {
            state.current = thermal_current;
            state.current_limit = CurrentLimit::Thermal;
        }
        if (density_current < state.current) {
            state.current = density_current;
            state.current_limit = CurrentLimit::CurrentDensity;
        }

        state.power = state.current * state.current * state.resistance;
        state.current_density = state.current / cross_section;

        state.ground = ThermalSolver::solve(constraints_, state.power, ThermalMode::Ground,
                                            config_.thermal);
        state.space = ThermalSolver::solve(constraints_, state.power, ThermalMode::Space,
                                           config_.thermal);

        state.thermal_converged = true;
        state.equilibrium_temp = -std::numeric_limits<double>::infinity();
        for (ThermalMode mode : modes) {
            const auto& solved = mode == ThermalMode::Ground ? state.ground : state.space;
            state.thermal_converged = state.thermal_converged && solved.converged();
            state.equilibrium_temp = std::max(state.equilibrium_temp, solved.temperature);
        }

        if (!config_.self_consistent_resistance || !state.thermal_converged) {
            break;
        }
        if (std::abs(state.equilibrium_temp - state.resistance_temp) < config_.coupling_tolerance) {
            break;
        }
        state.resistance_temp = state.equilibrium_temp;
    }

    state.magnetic_moment = magnetic_moment(point, state.current);
    return state;
}

double CoilModel::magnetic_moment(const DesignPoint& point, double current) const {
    if (point.turns < 1 || !(current > 0.0)) {
        return 0.0;
    }
    // n * I * A_mean * layers, with n * A_mean the summed turn area
    return current * winding_area(point.trace_width, point.turns) *
           constraints_.winding_layers();
}

CoilDynamics CoilModel::dynamics(const DesignPoint& point, double resistance) const {
    CoilDynamics result;
    if (point.turns < 1 || !(point.trace_width > 0.0)) {
        return result;
    }

    const auto& d = constraints_.design;
    double avg_length = (d.outer_length + d.inner_length) / 2.0;
    double avg_width = (d.outer_width + d.inner_width) / 2.0;
    double avg_diameter = (avg_length + avg_width) / 2.0;

    // Modified Wheeler formula, all winding layers in series
    constexpr double k1 = 0.4;
    double total_turns = static_cast<double>(point.turns) * constraints_.winding_layers();
    result.inductance = k1 * constraints_.physical.vacuum_permeability *
                        total_turns * total_turns * avg_diameter *
                        (std::log(4.0 * avg_diameter / point.trace_width) - 0.5);

    if (resistance > 0.0 && std::isfinite(resistance)) {
        result.time_constant = result.inductance / resistance;
        result.time_to_99_percent = -result.time_constant * std::log(1.0 - 0.99);
    }
    return result;
}

}  // namespace magtorq
