#include "constraint_evaluator.hpp"
#include <algorithm>

namespace magtorq {

const char* to_string(ResidualKind kind) {
    switch (kind) {
        case ResidualKind::Power: return "power";
        case ResidualKind::Thermal: return "thermal";
        case ResidualKind::CurrentDensity: return "current_density";
        case ResidualKind::GeometricFit: return "geometric_fit";
        case ResidualKind::InnerClearance: return "inner_clearance";
        case ResidualKind::MinimumTurns: return "minimum_turns";
    }
    return "unknown";
}

double ResidualSet::max_violation() const {
    double worst = 0.0;
    for (const auto& r : residuals) {
        worst = std::max(worst, r.normalized());
    }
    return worst;
}

const ConstraintResidual* ResidualSet::find(const std::string& name) const {
    for (const auto& r : residuals) {
        if (r.name == name) {
            return &r;
        }
    }
    return nullptr;
}

ConstraintEvaluator::ConstraintEvaluator(const CoilModel& model)
    : model_(model) {}

ConstraintResidual ConstraintEvaluator::thermal_residual(const std::string& name,
                                                         const ThermalSolveResult& solved) const {
    const auto& c = model_.constraints();
    ConstraintResidual r;
    r.kind = ResidualKind::Thermal;
    r.name = name;
    r.scale = c.design.operating_temp - solved.ambient;
    if (solved.converged()) {
        r.value = solved.temperature - c.design.operating_temp;
    } else {
        // No usable equilibrium: charge the full distance to the ceiling
        r.value = c.thermal.max_equilibrium_temp - c.design.operating_temp;
        r.diverged = true;
    }
    return r;
}

ResidualSet ConstraintEvaluator::evaluate(const DesignPoint& point,
                                          const ElectroThermalState& state) const {
    const auto& c = model_.constraints();
    ResidualSet set;

    ConstraintResidual power;
    power.kind = ResidualKind::Power;
    power.name = "power";
    power.value = state.power - c.design.max_power;
    power.scale = c.design.max_power;
    set.residuals.push_back(power);

    switch (model_.config().thermal_policy) {
        case ThermalPolicy::BothModes:
            set.residuals.push_back(thermal_residual("thermal_ground", state.ground));
            set.residuals.push_back(thermal_residual("thermal_space", state.space));
            break;
        case ThermalPolicy::WorstCase: {
            ConstraintResidual ground = thermal_residual("thermal_worst_case", state.ground);
            ConstraintResidual space = thermal_residual("thermal_worst_case", state.space);
            set.residuals.push_back(space.normalized() > ground.normalized() ? space : ground);
            break;
        }
        case ThermalPolicy::GroundOnly:
            set.residuals.push_back(thermal_residual("thermal_ground", state.ground));
            break;
        case ThermalPolicy::SpaceOnly:
            set.residuals.push_back(thermal_residual("thermal_space", state.space));
            break;
    }

    ConstraintResidual density;
    density.kind = ResidualKind::CurrentDensity;
    density.name = "current_density";
    density.value = state.current_density - c.physical.current_density_limit;
    density.scale = c.physical.current_density_limit;
    set.residuals.push_back(density);

    const double pitch = model_.turn_pitch(point.trace_width);
    const double keepout = model_.inner_keepout(point.trace_width);
    const struct {
        const char* axis;
        double half_span;
    } axes[] = {
        {"length", model_.half_span_length()},
        {"width", model_.half_span_width()},
    };

    for (const auto& axis : axes) {
        ConstraintResidual fit;
        fit.kind = ResidualKind::GeometricFit;
        fit.name = std::string("fit_") + axis.axis;
        fit.value = point.turns * pitch - axis.half_span;
        fit.scale = axis.half_span;
        set.residuals.push_back(fit);
    }

    for (const auto& axis : axes) {
        ConstraintResidual clearance;
        clearance.kind = ResidualKind::InnerClearance;
        clearance.name = std::string("clearance_") + axis.axis;
        clearance.value = keepout - model_.innermost_gap(axis.half_span, point.turns,
                                                         point.trace_width);
        clearance.scale = axis.half_span;
        set.residuals.push_back(clearance);
    }

    ConstraintResidual turns;
    turns.kind = ResidualKind::MinimumTurns;
    turns.name = "min_turns";
    turns.value = 1.0 - point.turns;
    turns.scale = 1.0;
    set.residuals.push_back(turns);

    return set;
}

}  // namespace magtorq
