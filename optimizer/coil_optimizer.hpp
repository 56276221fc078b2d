#ifndef MAGTORQ_COIL_OPTIMIZER_HPP
#define MAGTORQ_COIL_OPTIMIZER_HPP

#include "constraint_evaluator.hpp"
#include <coil/coil_model.hpp>
#include <atomic>
#include <functional>
#include <vector>

namespace magtorq {

// Progress of the inner width search, reported after each iteration.
// Called with (current point, iteration_number, magnetic_moment, max_violation).
// Returns true to continue, false to stop the whole search.
// May be called from several threads when the candidate sweep is parallel.
using OptimizerStepCallback = std::function<bool(const DesignPoint&, int, double, double)>;

struct OptimizeConfig {
    // Per-candidate iteration cap of the inner search
    int max_iterations = 500;

    // Convergence thresholds, checked jointly
    double objective_tolerance = 1e-9;    // relative change in moment
    double step_tolerance = 1e-9;         // step in the normalized width coordinate
    double constraint_tolerance = 1e-6;   // max normalized violation
    int stall_iterations = 3;             // consecutive iterations below all thresholds

    // Central finite-difference step in the normalized width coordinate
    double fd_step = 1e-6;

    // Step length control in the normalized width coordinate
    double initial_step = 0.25;
    double max_step = 1.0;
    double min_step = 1e-10;
    double step_growth = 1.5;

    // Wall-clock budget for the whole sweep, 0 = unlimited
    double time_budget_ms = 0.0;

    // Parallelization of the candidate sweep
    int num_threads = 1;  // 0 = auto-detect, > 0 = use specific count

    ModelConfig model;

    OptimizerStepCallback step_callback = nullptr;
};

enum class OptimizationStatus {
    Converged,
    Infeasible,
    BudgetExhausted
};

enum class CandidateStatus {
    Converged,
    Infeasible,
    IterationLimit,
    Skipped          // not searched, the budget ran out first
};

const char* to_string(OptimizationStatus status);
const char* to_string(CandidateStatus status);

// Outcome of the inner search for one turn count
struct CandidateSummary {
    int turns = 0;
    double width_min = 0.0;      // m, interval of widths giving this turn count
    double width_max = 0.0;
    double trace_width = 0.0;    // m, best point found
    double magnetic_moment = 0.0;
    double max_violation = 0.0;
    int iterations = 0;
    int evaluations = 0;
    CandidateStatus status = CandidateStatus::Skipped;

    bool feasible(double tolerance) const {
        return status != CandidateStatus::Skipped &&
               status != CandidateStatus::Infeasible &&
               max_violation <= tolerance;
    }
};

struct OptimizationResult {
    DesignPoint design;
    ElectroThermalState state;
    double magnetic_moment = 0.0;   // A m^2
    ResidualSet residuals;
    OptimizationStatus status = OptimizationStatus::Infeasible;

    DesignPoint seed;
    int iterations = 0;             // inner iterations over all candidates
    int evaluations = 0;            // model evaluations
    std::vector<CandidateSummary> candidates;   // ascending turn count

    CoilDynamics dynamics;

    bool converged() const { return status == OptimizationStatus::Converged; }

    // A design worth laying out: a budget-limited search may still have
    // committed to a point that satisfies every residual
    bool feasible(double tolerance) const {
        return status != OptimizationStatus::Infeasible &&
               design.turns >= 1 &&
               residuals.max_violation() <= tolerance;
    }
};

// Maximizes the magnetic moment over the trace width. The integer turn count
// is searched in an outer sweep; for each candidate the width is searched on
// the interval that maps to exactly that turn count.
class CoilOptimizer {
public:
    // Throws ConfigurationError when the constraint set is invalid
    static OptimizationResult optimize(const ConstraintSet& constraints,
                                       const OptimizeConfig& config = OptimizeConfig{});

    // Widths in [min_trace_width, max_trace_width] with turn_count(w) == turns.
    // Returns false when no width gives that turn count.
    static bool width_interval(const CoilModel& model, int turns,
                               double& width_min, double& width_max);

private:
    struct Evaluation {
        DesignPoint point;
        ElectroThermalState state;
        ResidualSet residuals;
        double objective = 0.0;
        double violation = 0.0;
    };

    static Evaluation evaluate(const CoilModel& model,
                               const ConstraintEvaluator& evaluator,
                               double trace_width);

    // Runs the width search on [summary.width_min, summary.width_max]
    static void search_candidate(const CoilModel& model,
                                 const ConstraintEvaluator& evaluator,
                                 double seed_width,
                                 const OptimizeConfig& config,
                                 CandidateSummary& summary,
                                 std::atomic<bool>& stop_requested);
};

}  // namespace magtorq

#endif // MAGTORQ_COIL_OPTIMIZER_HPP
