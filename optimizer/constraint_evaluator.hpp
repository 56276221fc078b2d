#ifndef MAGTORQ_CONSTRAINT_EVALUATOR_HPP
#define MAGTORQ_CONSTRAINT_EVALUATOR_HPP

#include <coil/coil_model.hpp>
#include <string>
#include <vector>

namespace magtorq {

// What a residual constrains
enum class ResidualKind {
    Power,
    Thermal,
    CurrentDensity,
    GeometricFit,
    InnerClearance,
    MinimumTurns
};

const char* to_string(ResidualKind kind);

// Signed residual, satisfied when value <= 0
struct ConstraintResidual {
    ResidualKind kind = ResidualKind::Power;
    std::string name;
    double value = 0.0;
    double scale = 1.0;      // value / scale is dimensionless
    bool diverged = false;   // thermal solve did not reach an equilibrium

    double normalized() const { return value / scale; }
    bool satisfied(double tolerance = 0.0) const { return normalized() <= tolerance; }
};

struct ResidualSet {
    std::vector<ConstraintResidual> residuals;

    // Largest normalized violation, zero when every residual is satisfied
    double max_violation() const;

    bool feasible(double tolerance) const { return max_violation() <= tolerance; }

    // nullptr when no residual carries that name
    const ConstraintResidual* find(const std::string& name) const;

    size_t size() const { return residuals.size(); }
    bool empty() const { return residuals.empty(); }
};

// Assembles the residual vector of one design point from the model's
// derived state. Bounds on the trace width are not residuals.
class ConstraintEvaluator {
public:
    explicit ConstraintEvaluator(const CoilModel& model);

    ResidualSet evaluate(const DesignPoint& point, const ElectroThermalState& state) const;

private:
    ConstraintResidual thermal_residual(const std::string& name,
                                        const ThermalSolveResult& solved) const;

    const CoilModel& model_;
};

}  // namespace magtorq

#endif // MAGTORQ_CONSTRAINT_EVALUATOR_HPP
