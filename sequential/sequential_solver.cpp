///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
template <typename TimePoint>
static double millisecondsSince(TimePoint start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
SequentialAnnealingSolver::SequentialAnnealingSolver(const SolverConfig& config)
        : config_(config) {
    validateConfig(config_);
}

SolveResult SequentialAnnealingSolver::solve(const ProblemDescription& inst) {
    Mt19937Source rng(config_.seed);
    return solve(inst, rng);
}

/**
 * @brief Init state: validate, derive candidates, draw a random assignment.
 */
SolveResult SequentialAnnealingSolver::solve(const ProblemDescription& inst, IRandomSource& rng) {
    auto start = Clock::now();

    IncidenceIndex index;
    CandidateSet candidates;
    SolveResult early;
    if (!prepare(inst, index, candidates, early, start)) {
        return early;
    }

    Assignment initial = drawRandomAssignment(candidates, rng);
    return anneal(inst, index, candidates, std::move(initial), rng, start);
}

SolveResult SequentialAnnealingSolver::solveFrom(const ProblemDescription& inst,
                                                 const Assignment& initial,
                                                 IRandomSource& rng) {
    auto start = Clock::now();

    IncidenceIndex index;
    CandidateSet candidates;
    SolveResult early;
    if (!prepare(inst, index, candidates, early, start)) {
        return early;
    }

    if (!isCandidateAssignment(candidates, initial)) {
        throw std::invalid_argument("solveFrom: initial assignment uses a non-candidate placement");
    }
    return anneal(inst, index, candidates, initial, rng, start);
}

bool SequentialAnnealingSolver::prepare(const ProblemDescription& inst,
                                        IncidenceIndex& index,
                                        CandidateSet& candidates,
                                        SolveResult& result,
                                        Clock::time_point start) const {
    validateProblem(inst);

    // Nothing to schedule: trivially satisfied without consuming budget.
    if (inst.numExams == 0) {
        result.status = SolveStatus::FEASIBLE;
        result.reason = FailureReason::NONE;
        result.assignment = Assignment{};
        result.bestCost = 0;
        result.elapsedMs = millisecondsSince(start);
        return false;
    }

    index = buildIncidenceIndex(inst);
    candidates = buildCandidates(inst, index, config_.rules);

    // An exam with no eligible placement can never be scheduled.
    int blocked = firstExamWithoutCandidates(candidates);
    if (blocked >= 0) {
        result.status = SolveStatus::INFEASIBLE;
        result.reason = FailureReason::STRUCTURAL_INFEASIBILITY;
        result.blockedExam = blocked;
        result.iterations = 0;
        result.elapsedMs = millisecondsSince(start);
        return false;
    }
    return true;
}

/**
 * @brief Metropolis loop over single-exam relocations.
 *
 * Each iteration picks an exam and one of its candidates. Proposals equal to
 * the current placement are skipped but still consume the iteration. The
 * acceptance baseline is the best cost, not the current one.
 */
SolveResult SequentialAnnealingSolver::anneal(const ProblemDescription& inst,
                                              const IncidenceIndex& index,
                                              const CandidateSet& candidates,
                                              Assignment initial,
                                              IRandomSource& rng,
                                              Clock::time_point start) const {
    CostEvaluator evaluator(inst, index, config_.rules, config_.weights);
    const AnnealingSchedule& schedule = config_.schedule;
    const int numExams = inst.numExams;

    SearchState state{std::move(initial), {}, 0, 0, schedule.tStart, rng};
    state.best = state.current;
    state.bestCost = evaluator.cost(state.current);

    SolveResult result;
    if (config_.recordTrace) {
        result.bestCostTrace.reserve(schedule.maxIterations);
    }

    for (state.iteration = 0; state.iteration < schedule.maxIterations; ++state.iteration) {
        if (state.bestCost == 0) break;

        state.temperature = schedule.temperatureAt(state.iteration);

        // Propose: relocate one exam to one of its candidates.
        int exam = state.rng.uniformIndex(numExams);
        const auto& options = candidates[exam];
        Placement old = state.current[exam];
        Placement next = options[state.rng.uniformIndex((int)options.size())];

        if (next != old) {
            state.current[exam] = next;
            int newCost = evaluator.cost(state.current);

            if (newCost < state.bestCost) {
                state.bestCost = newCost;
                state.best = state.current;
            } else {
                double t = std::max(state.temperature, AnnealingSchedule::kMinTemperature);
                double acceptProb = std::exp(-(double)(newCost - state.bestCost) / t);
                if (state.rng.uniformReal() >= acceptProb) {
                    state.current[exam] = old;
                }
            }
        }

        if (config_.recordTrace) {
            result.bestCostTrace.push_back(state.bestCost);
        }
    }

    result.iterations = state.iteration;
    result.bestCost = state.bestCost;
    result.assignment = std::move(state.best);
    if (state.bestCost == 0) {
        result.status = SolveStatus::FEASIBLE;
        result.reason = FailureReason::NONE;
    } else {
        result.status = SolveStatus::INFEASIBLE;
        result.reason = FailureReason::SEARCH_EXHAUSTED;
    }
    result.elapsedMs = millisecondsSince(start);
    return result;
}
