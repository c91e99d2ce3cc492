///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include "../sequential/sequential_solver.hpp"
#include "random_source.hpp"
#include <chrono>
#include <stdexcept>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
OpenCLSeededAnnealingSolver::OpenCLSeededAnnealingSolver(const SolverConfig& config, int batchSize)
        : config_(config),
          batchSize_(batchSize) {
    if (batchSize_ < 1) {
        throw std::invalid_argument("OpenCLSeededAnnealingSolver: batchSize must be >= 1");
    }
    validateConfig(config_);
}

/**
 * @brief Score batchSize_ random starts on the device, anneal from the best.
 *
 * Empty and structurally infeasible instances are answered by the CPU solver
 * directly; the device is only used when there is something to search. The
 * reported time covers the random starts and the device scoring as well.
 */
SolveResult OpenCLSeededAnnealingSolver::solve(const ProblemDescription& inst) {
    auto start = std::chrono::steady_clock::now();
    startCosts_.clear();
    chosenStart_ = -1;

    SequentialAnnealingSolver annealer(config_);
    Mt19937Source rng(config_.seed);

    validateProblem(inst);
    IncidenceIndex index = buildIncidenceIndex(inst);
    CandidateSet candidates = buildCandidates(inst, index, config_.rules);
    if (inst.numExams == 0 || firstExamWithoutCandidates(candidates) >= 0) {
        return annealer.solve(inst, rng);
    }

    // Random starts, drawn in sequence from the single stream.
    std::vector<Assignment> starts;
    starts.reserve(batchSize_);
    for (int i = 0; i < batchSize_; ++i) {
        starts.push_back(drawRandomAssignment(candidates, rng));
    }

    clctx_.evaluateBatch(inst, index, config_.rules, config_.weights, starts, startCosts_);

    chosenStart_ = 0;
    for (int i = 1; i < (int)startCosts_.size(); ++i) {
        if (startCosts_[i] < startCosts_[chosenStart_]) {
            chosenStart_ = i;
        }
    }

    SolveResult result = annealer.solveFrom(inst, starts[chosenStart_], rng);
    auto end = std::chrono::steady_clock::now();
    result.elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}
