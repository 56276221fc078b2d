#include "coil_optimizer.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace magtorq {

const char* to_string(OptimizationStatus status) {
    switch (status) {
        case OptimizationStatus::Converged: return "converged";
        case OptimizationStatus::Infeasible: return "infeasible";
        case OptimizationStatus::BudgetExhausted: return "budget_exhausted";
    }
    return "unknown";
}

const char* to_string(CandidateStatus status) {
    switch (status) {
        case CandidateStatus::Converged: return "converged";
        case CandidateStatus::Infeasible: return "infeasible";
        case CandidateStatus::IterationLimit: return "iteration_limit";
        case CandidateStatus::Skipped: return "skipped";
    }
    return "unknown";
}

bool CoilOptimizer::width_interval(const CoilModel& model, int turns,
                                   double& width_min, double& width_max) {
    const auto& m = model.constraints().manufacturing;
    const double w_lo = m.min_trace_width;
    const double w_hi = m.max_trace_width;

    // turn_count is non-increasing in w, so both ends are found by bisection
    if (model.turn_count(w_lo) < turns || model.turn_count(w_hi) > turns) {
        return false;
    }

    // Smallest width with turn_count <= turns
    if (model.turn_count(w_lo) <= turns) {
        width_min = w_lo;
    } else {
        double lo = w_lo;
        double hi = w_hi;
        for (int iter = 0; iter < 200; ++iter) {
            double mid = 0.5 * (lo + hi);
            if (mid <= lo || mid >= hi) {
                break;
            }
            if (model.turn_count(mid) <= turns) {
                hi = mid;
            } else {
                lo = mid;
            }
        }
        width_min = hi;
    }

    // Largest width with turn_count >= turns
    if (model.turn_count(w_hi) >= turns) {
        width_max = w_hi;
    } else {
        double lo = w_lo;
        double hi = w_hi;
        for (int iter = 0; iter < 200; ++iter) {
            double mid = 0.5 * (lo + hi);
            if (mid <= lo || mid >= hi) {
                break;
            }
            if (model.turn_count(mid) >= turns) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        width_max = lo;
    }

    return width_min <= width_max &&
           model.turn_count(width_min) == turns &&
           model.turn_count(width_max) == turns;
}

CoilOptimizer::Evaluation CoilOptimizer::evaluate(const CoilModel& model,
                                                  const ConstraintEvaluator& evaluator,
                                                  double trace_width) {
    Evaluation e;
    e.point = model.design_point(trace_width);
    e.state = model.evaluate(e.point);
    e.residuals = evaluator.evaluate(e.point, e.state);
    e.objective = e.state.magnetic_moment;
    e.violation = e.residuals.max_violation();
    return e;
}

void CoilOptimizer::search_candidate(const CoilModel& model,
                                     const ConstraintEvaluator& evaluator,
                                     double seed_width,
                                     const OptimizeConfig& config,
                                     CandidateSummary& summary,
                                     std::atomic<bool>& stop_requested) {
    auto log = magtorq::logging::get_logger();

    const double width_min = summary.width_min;
    const double width_max = summary.width_max;
    const double span = width_max - width_min;
    const double tol = config.constraint_tolerance;

    auto to_width = [&](double x) {
        if (x <= 0.0) return width_min;
        if (x >= 1.0) return width_max;
        return width_min + x * span;
    };

    auto record = [&](const Evaluation& e) {
        summary.trace_width = e.point.trace_width;
        summary.magnetic_moment = e.objective;
        summary.max_violation = e.violation;
    };

    // Single admissible width: nothing to search
    if (!(span > 0.0)) {
        Evaluation e = evaluate(model, evaluator, width_min);
        summary.evaluations = 1;
        summary.iterations = 1;
        record(e);
        summary.status = e.violation <= tol ? CandidateStatus::Converged
                                            : CandidateStatus::Infeasible;
        return;
    }

    double x = std::clamp((seed_width - width_min) / span, 0.0, 1.0);
    Evaluation current = evaluate(model, evaluator, to_width(x));
    summary.evaluations = 1;

    double alpha = config.initial_step;
    int stall = 0;
    bool finished = false;

    for (int iter = 0; iter < config.max_iterations; ++iter) {
        if (stop_requested.load()) {
            break;
        }
        summary.iterations = iter + 1;

        const bool feasible = current.violation <= tol;

        // Feasible phase climbs the moment, restoration descends the violation
        double xp = std::min(1.0, x + config.fd_step);
        double xm = std::max(0.0, x - config.fd_step);
        Evaluation ep = evaluate(model, evaluator, to_width(xp));
        Evaluation em = evaluate(model, evaluator, to_width(xm));
        summary.evaluations += 2;

        double slope = feasible ? (ep.objective - em.objective) / (xp - xm)
                                : (ep.violation - em.violation) / (xp - xm);
        double direction = 0.0;
        if (slope > 0.0) {
            direction = feasible ? 1.0 : -1.0;
        } else if (slope < 0.0) {
            direction = feasible ? -1.0 : 1.0;
        }

        double trial_x = std::clamp(x + alpha * direction, 0.0, 1.0);
        double step = std::abs(trial_x - x);
        if (direction == 0.0 || step <= config.min_step) {
            // Stationary, or pinned against the end of the interval
            summary.status = feasible ? CandidateStatus::Converged : CandidateStatus::Infeasible;
            finished = true;
            break;
        }

        Evaluation trial = evaluate(model, evaluator, to_width(trial_x));
        summary.evaluations += 1;

        bool accept = feasible
            ? (trial.violation <= tol && trial.objective > current.objective)
            : (trial.violation < current.violation);

        if (accept) {
            double change = std::abs(trial.objective - current.objective) /
                            std::max(std::abs(current.objective), 1e-300);
            x = trial_x;
            current = trial;
            alpha = std::min(alpha * config.step_growth, config.max_step);

            if (change < config.objective_tolerance && step < config.step_tolerance &&
                current.violation <= tol) {
                ++stall;
            } else {
                stall = 0;
            }
            if (stall >= config.stall_iterations) {
                summary.status = CandidateStatus::Converged;
                finished = true;
            }
        } else {
            alpha *= 0.5;
            if (alpha < config.min_step) {
                summary.status = feasible ? CandidateStatus::Converged
                                          : CandidateStatus::Infeasible;
                finished = true;
            }
        }

        if (config.step_callback &&
            !config.step_callback(current.point, iter + 1, current.objective, current.violation)) {
            log->info("CoilOptimizer: stopped by callback at n = {}, iteration {}",
                      summary.turns, iter + 1);
            stop_requested.store(true);
        }

        if (finished) {
            break;
        }
    }

    if (!finished) {
        summary.status = current.violation <= tol ? CandidateStatus::IterationLimit
                                                  : CandidateStatus::Infeasible;
    }
    record(current);

    log->debug("CoilOptimizer: n = {} w = {:.6f} mm moment = {:.6e} violation = {:.3e} ({}, {} iterations)",
               summary.turns, summary.trace_width * 1e3, summary.magnetic_moment,
               summary.max_violation, to_string(summary.status), summary.iterations);
}

OptimizationResult CoilOptimizer::optimize(const ConstraintSet& constraints,
                                           const OptimizeConfig& config) {
    auto log = magtorq::logging::get_logger();

    require_valid(constraints);

    CoilModel model(constraints, config.model);
    ConstraintEvaluator evaluator(model);
    const auto& m = constraints.manufacturing;
    const double tol = config.constraint_tolerance;

    OptimizationResult result;

    // Seed at the geometric mean of the width bounds
    double seed_width = std::sqrt(m.min_trace_width * m.max_trace_width);
    Evaluation seed = evaluate(model, evaluator, seed_width);
    result.seed = seed.point;
    result.evaluations = 1;

    log->info("CoilOptimizer: seed w = {:.4f} mm, n = {}, moment = {:.6f} A m^2, violation = {:.3e}",
              seed_width * 1e3, seed.point.turns, seed.objective, seed.violation);

    int n_first = std::max(1, model.turn_count(m.max_trace_width));
    int n_last = model.turn_count(m.min_trace_width);

    for (int n = n_first; n <= n_last; ++n) {
        CandidateSummary candidate;
        candidate.turns = n;
        if (width_interval(model, n, candidate.width_min, candidate.width_max)) {
            result.candidates.push_back(candidate);
        }
    }

    auto finish = [&](const Evaluation& e) {
        result.design = e.point;
        result.state = e.state;
        result.magnetic_moment = e.objective;
        result.residuals = e.residuals;
        result.dynamics = model.dynamics(e.point, e.state.resistance);
    };

    if (result.candidates.empty()) {
        log->warn("CoilOptimizer: no trace width in [{:.4f}, {:.4f}] mm fits a single turn",
                  m.min_trace_width * 1e3, m.max_trace_width * 1e3);
        result.status = OptimizationStatus::Infeasible;
        finish(seed);
        return result;
    }

    log->info("CoilOptimizer: searching {} turn counts ({} to {})",
              result.candidates.size(), result.candidates.front().turns,
              result.candidates.back().turns);

    // Configure OpenMP thread count
    int use_threads = 1;
    #ifdef _OPENMP
    use_threads = (config.num_threads > 0) ? config.num_threads : omp_get_max_threads();
    omp_set_num_threads(use_threads);
    #endif
    log->debug("CoilOptimizer: candidate sweep on {} thread(s)", use_threads);

    using Clock = std::chrono::steady_clock;
    const bool has_deadline = config.time_budget_ms > 0.0;
    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(config.time_budget_ms));

    std::atomic<bool> stop_requested{false};
    std::atomic<bool> budget_hit{false};
    const int count = static_cast<int>(result.candidates.size());

    // Each candidate writes only to its own slot
    #pragma omp parallel for schedule(dynamic) if(use_threads > 1)
    for (int i = 0; i < count; ++i) {
        if (stop_requested.load()) {
            continue;
        }
        if (has_deadline && Clock::now() >= deadline) {
            budget_hit.store(true);
            continue;
        }
        search_candidate(model, evaluator, seed_width, config,
                         result.candidates[i], stop_requested);
    }

    for (const auto& c : result.candidates) {
        result.iterations += c.iterations;
        result.evaluations += c.evaluations;
    }

    const bool interrupted = budget_hit.load() || stop_requested.load();

    // Largest moment wins; ascending order makes ties go to fewer turns
    const CandidateSummary* best = nullptr;
    for (const auto& c : result.candidates) {
        if (c.feasible(tol) && (!best || c.magnetic_moment > best->magnetic_moment)) {
            best = &c;
        }
    }

    if (best) {
        finish(evaluate(model, evaluator, best->trace_width));
        result.evaluations += 1;
        result.status = (interrupted || best->status == CandidateStatus::IterationLimit)
            ? OptimizationStatus::BudgetExhausted
            : OptimizationStatus::Converged;

        log->info("CoilOptimizer: {} with n = {}, w = {:.4f} mm, I = {:.4f} A ({}-limited), "
                  "P = {:.4f} W, moment = {:.6f} A m^2",
                  to_string(result.status), result.design.turns,
                  result.design.trace_width * 1e3, result.state.current,
                  to_string(result.state.current_limit), result.state.power,
                  result.magnetic_moment);
        return result;
    }

    // Nothing feasible: report the least-violating point searched
    const CandidateSummary* closest = nullptr;
    for (const auto& c : result.candidates) {
        if (c.status == CandidateStatus::Skipped) {
            continue;
        }
        if (!closest || c.max_violation < closest->max_violation) {
            closest = &c;
        }
    }

    if (closest) {
        finish(evaluate(model, evaluator, closest->trace_width));
        result.evaluations += 1;
    } else {
        finish(seed);
    }
    result.status = interrupted ? OptimizationStatus::BudgetExhausted
                                : OptimizationStatus::Infeasible;

    log->warn("CoilOptimizer: {}, least violation {:.3e} at n = {}, w = {:.4f} mm",
              to_string(result.status), result.residuals.max_violation(),
              result.design.turns, result.design.trace_width * 1e3);
    return result;
}

}  // namespace magtorq
