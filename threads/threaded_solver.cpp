///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "../sequential/sequential_solver.hpp"
#include <chrono>
#include <future>
#include <stdexcept>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Validate the configuration up front so no thread ever throws on it.
 */
ThreadedMultiStartSolver::ThreadedMultiStartSolver(const SolverConfig& config, int numThreads)
        : config_(config),
          numThreads_(numThreads) {
    if (numThreads_ < 1) {
        throw std::invalid_argument("ThreadedMultiStartSolver: numThreads must be >= 1");
    }
    validateConfig(config_);
}

/**
 * @brief Feasible beats infeasible; then lower best cost.
 *
 * Structurally infeasible results never ran a search and rank last.
 */
bool ThreadedMultiStartSolver::betterResult(const SolveResult& a, const SolveResult& b) {
    if (a.feasible() != b.feasible()) return a.feasible();

    bool aRan = a.reason != FailureReason::STRUCTURAL_INFEASIBILITY;
    bool bRan = b.reason != FailureReason::STRUCTURAL_INFEASIBILITY;
    if (aRan != bRan) return aRan;

    return a.bestCost < b.bestCost;
}

/**
 * @brief Launch one annealing chain per thread and keep the best outcome.
 *
 * The instance is validated on the calling thread so input errors surface
 * synchronously instead of through a future.
 */
SolveResult ThreadedMultiStartSolver::solve(const ProblemDescription& inst) {
    auto start = std::chrono::steady_clock::now();
    validateProblem(inst);

    std::vector<std::future<SolveResult>> tasks;
    tasks.reserve(numThreads_);
    for (int i = 0; i < numThreads_; ++i) {
        SolverConfig chainConfig = config_;
        chainConfig.seed = config_.seed + (std::uint64_t)i;
        tasks.push_back(std::async(std::launch::async,
                                   [chainConfig, &inst]() {
                                       SequentialAnnealingSolver chain(chainConfig);
                                       return chain.solve(inst);
                                   }));
    }

    lastResults_.clear();
    lastResults_.reserve(numThreads_);
    for (auto& t : tasks) {
        lastResults_.push_back(t.get());
    }

    // Scan in chain order; strict comparison keeps the lowest index on ties.
    lastWinner_ = 0;
    for (int i = 1; i < numThreads_; ++i) {
        if (betterResult(lastResults_[i], lastResults_[lastWinner_])) {
            lastWinner_ = i;
        }
    }

    SolveResult best = lastResults_[lastWinner_];
    auto end = std::chrono::steady_clock::now();
    best.elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();
    return best;
}
