#ifndef MAGTORQ_THERMAL_SOLVER_HPP
#define MAGTORQ_THERMAL_SOLVER_HPP

#include <coil/constraint_set.hpp>
#include <string>

namespace magtorq {

// Operating environment of the board
enum class ThermalMode {
    Ground,  // bench test, ambient_temp
    Space    // on orbit, space_ambient_temp baseplate
};

enum class ThermalStatus {
    Converged,
    AboveCeiling,     // no equilibrium below max_equilibrium_temp
    IterationLimit    // root-find hit its iteration cap
};

const char* to_string(ThermalMode mode);
const char* to_string(ThermalStatus status);

// Configuration for the equilibrium root-find
struct ThermalSolveConfig {
    // Convergence threshold on the temperature update (K)
    double tolerance = 1e-9;

    // Hard iteration cap; exceeding it is reported, never looped past
    int max_iterations = 60;
};

// Result of one equilibrium solve
struct ThermalSolveResult {
    ThermalStatus status = ThermalStatus::Converged;
    double temperature = 0.0;   // C; the ceiling when no equilibrium exists
    double ambient = 0.0;       // C
    double residual = 0.0;      // W, heat balance at the returned temperature
    int iterations = 0;

    bool converged() const { return status == ThermalStatus::Converged; }
    double temperature_rise() const { return temperature - ambient; }
};

// Steady-state heat balance of the board:
//   P = eps * sigma * A * (T^4 - Ta^4) + h * A * (T - Ta)
// where h is the ground convection coefficient (zero in space).
class ThermalSolver {
public:
    // Equilibrium temperature for a dissipated power
    static ThermalSolveResult solve(const ConstraintSet& constraints,
                                    double power,
                                    ThermalMode mode,
                                    const ThermalSolveConfig& config = ThermalSolveConfig{});

    // Largest dissipation that keeps the board at or below temperature (C)
    static double max_power(const ConstraintSet& constraints,
                            double temperature,
                            ThermalMode mode);

    static double ambient_temp(const ConstraintSet& constraints, ThermalMode mode);

private:
    static double convection_coefficient(const ConstraintSet& constraints, ThermalMode mode);

    // Heat rejected at temperature T (K)
    static double heat_rejected(const ConstraintSet& constraints, ThermalMode mode,
                                double t_kelvin, double ambient_kelvin);
};

}  // namespace magtorq

#endif // MAGTORQ_THERMAL_SOLVER_HPP
