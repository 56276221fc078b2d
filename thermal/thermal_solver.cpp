#include "thermal_solver.hpp"
#include <common/logging.hpp>
#include <cmath>

namespace magtorq {

const char* to_string(ThermalMode mode) {
    switch (mode) {
        case ThermalMode::Ground: return "ground";
        case ThermalMode::Space: return "space";
    }
    return "unknown";
}

const char* to_string(ThermalStatus status) {
    switch (status) {
        case ThermalStatus::Converged: return "converged";
        case ThermalStatus::AboveCeiling: return "above_ceiling";
        case ThermalStatus::IterationLimit: return "iteration_limit";
    }
    return "unknown";
}

double ThermalSolver::ambient_temp(const ConstraintSet& constraints, ThermalMode mode) {
    return mode == ThermalMode::Ground ? constraints.design.ambient_temp
                                       : constraints.thermal.space_ambient_temp;
}

double ThermalSolver::convection_coefficient(const ConstraintSet& constraints, ThermalMode mode) {
    return mode == ThermalMode::Ground ? constraints.thermal.ground_convection_coefficient : 0.0;
}

double ThermalSolver::heat_rejected(const ConstraintSet& constraints, ThermalMode mode,
                                    double t_kelvin, double ambient_kelvin) {
    double area = constraints.radiating_area();
    double t2 = t_kelvin * t_kelvin;
    double a2 = ambient_kelvin * ambient_kelvin;
    double radiated = constraints.thermal.emissivity * STEFAN_BOLTZMANN * area *
                      (t2 * t2 - a2 * a2);
    double convected = convection_coefficient(constraints, mode) * area *
                       (t_kelvin - ambient_kelvin);
    return radiated + convected;
}

double ThermalSolver::max_power(const ConstraintSet& constraints,
                                double temperature,
                                ThermalMode mode) {
    double ambient_k = to_kelvin(ambient_temp(constraints, mode));
    double t_k = to_kelvin(temperature);
    if (t_k <= ambient_k) {
        return 0.0;
    }
    return heat_rejected(constraints, mode, t_k, ambient_k);
}

ThermalSolveResult ThermalSolver::solve(const ConstraintSet& constraints,
                                        double power,
                                        ThermalMode mode,
                                        const ThermalSolveConfig& config) {
    auto log = magtorq::logging::get_logger();

    ThermalSolveResult result;
    result.ambient = ambient_temp(constraints, mode);

    double lo = to_kelvin(result.ambient);
    double hi = to_kelvin(constraints.thermal.max_equilibrium_temp);

    if (!(power > 0.0)) {
        result.temperature = result.ambient;
        return result;
    }

    // Balance is monotonic above ambient; no root below the ceiling means
    // the dissipation cannot be rejected at any acceptable temperature
    double f_hi = heat_rejected(constraints, mode, hi, lo) - power;
    if (f_hi < 0.0) {
        result.status = ThermalStatus::AboveCeiling;
        result.temperature = constraints.thermal.max_equilibrium_temp;
        result.residual = f_hi;
        log->trace("ThermalSolver: {} W exceeds {} ceiling capacity", power, to_string(mode));
        return result;
    }

    // Safeguarded Newton from the upper bracket. The balance is convex in T,
    // so the iterates approach the root from above.
    double area = constraints.radiating_area();
    double k_rad = constraints.thermal.emissivity * STEFAN_BOLTZMANN * area;
    double k_conv = convection_coefficient(constraints, mode) * area;

    double t = hi;
    for (int iter = 0; iter < config.max_iterations; ++iter) {
        double f = heat_rejected(constraints, mode, t, to_kelvin(result.ambient)) - power;
        result.iterations = iter + 1;
        if (f == 0.0) {
            result.temperature = to_celsius(t);
            return result;
        }
        if (f > 0.0) {
            hi = t;
        } else {
            lo = t;
        }

        double df = 4.0 * k_rad * t * t * t + k_conv;
        double newton_step = f / df;
        if (std::abs(newton_step) < config.tolerance) {
            result.temperature = to_celsius(t);
            result.residual = f;
            return result;
        }

        double next = t - newton_step;
        if (!(next > lo && next < hi)) {
            next = 0.5 * (lo + hi);
        }

        double step = std::abs(next - t);
        t = next;

        if (step < config.tolerance) {
            result.temperature = to_celsius(t);
            result.residual = heat_rejected(constraints, mode, t, to_kelvin(result.ambient)) - power;
            return result;
        }
    }

    result.status = ThermalStatus::IterationLimit;
    result.temperature = to_celsius(t);
    result.residual = heat_rejected(constraints, mode, t, to_kelvin(result.ambient)) - power;
    log->warn("ThermalSolver: {} mode did not converge after {} iterations (T = {:.3f} C)",
              to_string(mode), result.iterations, result.temperature);
    return result;
}

}  // namespace magtorq
