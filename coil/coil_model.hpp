#ifndef MAGTORQ_COIL_MODEL_HPP
#define MAGTORQ_COIL_MODEL_HPP

#include "constraint_set.hpp"
#include <thermal/thermal_solver.hpp>
#include <vector>

namespace magtorq {

// The optimization variable: trace width, with the turn count and copper
// thickness it implies
struct DesignPoint {
    double trace_width = 0.0;       // m
    int turns = 0;                  // per winding layer
    double copper_thickness = 0.0;  // m
};

// Which limit set the coil current
enum class CurrentLimit {
    Voltage,         // V / R
    Thermal,         // keeps the board at operating_temp
    CurrentDensity   // j_max * w * t
};

// How the thermal constraint is enforced across operating modes
enum class ThermalPolicy {
    BothModes,   // ground and space each at or below operating_temp
    WorstCase,   // the hotter of the two modes at or below operating_temp
    GroundOnly,
    SpaceOnly
};

const char* to_string(CurrentLimit limit);
const char* to_string(ThermalPolicy policy);

struct ModelConfig {
    ThermalPolicy thermal_policy = ThermalPolicy::BothModes;

    // Resistance is compensated at operating_temp unless this is set, in
    // which case R(T_eq) and T_eq(P) are iterated to a fixed point
    bool self_consistent_resistance = false;
    int max_coupling_iterations = 50;
    double coupling_tolerance = 1e-6;   // C

    ThermalSolveConfig thermal;
};

// Centerline rectangle of one turn, centered on the board origin
struct TurnRect {
    double half_length = 0.0;   // along y
    double half_width = 0.0;    // along x

    double perimeter() const { return 4.0 * (half_length + half_width); }
    double area() const { return 4.0 * half_length * half_width; }
};

// Derived electrical and thermal quantities of one design point.
// Valid only for the point it was computed from.
struct ElectroThermalState {
    double trace_length = 0.0;       // m, all winding layers
    double resistance = 0.0;         // Ohm
    double resistance_temp = 0.0;    // C, temperature used for compensation
    double current = 0.0;            // A
    CurrentLimit current_limit = CurrentLimit::Voltage;
    double power = 0.0;              // W
    double current_density = 0.0;    // A/m^2

    ThermalSolveResult ground;
    ThermalSolveResult space;
    double equilibrium_temp = 0.0;   // C, hottest enforced mode
    bool thermal_converged = true;   // every enforced mode converged
    int coupling_iterations = 0;

    double winding_area = 0.0;       // m^2, sum of turn areas on one layer
    double magnetic_moment = 0.0;    // A m^2
};

// Transient behaviour of the coil when driven
struct CoilDynamics {
    double inductance = 0.0;          // H
    double time_constant = 0.0;       // s
    double time_to_99_percent = 0.0;  // s
};

// Closed-form coil model. Every geometric quantity used by the optimizer,
// the constraint evaluator and the spiral builder comes from here.
class CoilModel {
public:
    explicit CoilModel(const ConstraintSet& constraints,
                       const ModelConfig& config = ModelConfig{});

    const ConstraintSet& constraints() const { return constraints_; }
    const ModelConfig& config() const { return config_; }

    // Geometry
    double turn_pitch(double trace_width) const;
    double lane_width(double trace_width) const;
    double inner_keepout(double trace_width) const;
    double half_span_length() const;
    double half_span_width() const;

    // Turns that fit on one axis; zero when none fit
    int turns_for_span(double half_span, double trace_width) const;

    // Turns per layer for a trace width (minimum over both axes)
    int turn_count(double trace_width) const;

    // Turn k, counted from the outer edge inward
    TurnRect turn_rect(int turn, double trace_width) const;

    // Distance from the innermost trace edge to the cutout on one axis
    double innermost_gap(double half_span, int turns, double trace_width) const;

    // Trace length of all winding layers
    double total_trace_length(double trace_width, int turns) const;

    // Sum of the enclosed turn areas on one layer
    double winding_area(double trace_width, int turns) const;

    DesignPoint design_point(double trace_width) const;

    // Electrical
    double resistance(double trace_length, double trace_width, double temperature) const;
    double current_density_limit_current(double trace_width) const;

    // Largest dissipation satisfying every enforced thermal mode
    double thermal_power_limit() const;

    std::vector<ThermalMode> enforced_modes() const;

    ElectroThermalState evaluate(const DesignPoint& point) const;

    double magnetic_moment(const DesignPoint& point, double current) const;

    CoilDynamics dynamics(const DesignPoint& point, double resistance) const;

private:
    const ConstraintSet& constraints_;
    ModelConfig config_;
};

}  // namespace magtorq

#endif // MAGTORQ_COIL_MODEL_HPP
