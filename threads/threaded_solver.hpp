#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "solver_config.hpp"
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multi-start annealing: independent chains on worker threads.
 *
 * Chain i is a SequentialAnnealingSolver seeded with seedBase + i. Chains
 * share only the read-only instance; each owns its search state and random
 * stream. The winner is the first feasible chain, otherwise the chain with
 * the lowest best cost, ties broken by chain index, so the outcome does not
 * depend on thread timing.
 */
class ThreadedMultiStartSolver : public ISolver {
public:
    /**
     * @brief Create a threaded multi-start solver.
     *
     * @param config     Per-chain configuration; chain i uses config.seed + i.
     * @param numThreads Number of chains, one per worker thread (>= 1).
     */
    ThreadedMultiStartSolver(const SolverConfig& config, int numThreads);

    /**
     * @brief Run all chains and return the winning chain's result.
     *
     * elapsedMs is the wall-clock time of the whole multi-start.
     */
    SolveResult solve(const ProblemDescription& inst) override;

    /// Index of the chain that produced the last result (-1 before any solve).
    int lastWinningChain() const { return lastWinner_; }

    /// Per-chain results of the last solve, indexed by chain.
    const std::vector<SolveResult>& lastChainResults() const { return lastResults_; }

    /**
     * @brief Deterministic ordering used to pick a winner.
     *
     * @return true if a is strictly better than b.
     */
    static bool betterResult(const SolveResult& a, const SolveResult& b);

private:
    SolverConfig config_;  ///< Base configuration shared by all chains.
    int numThreads_;       ///< Number of chains / worker threads.

    int lastWinner_ = -1;
    std::vector<SolveResult> lastResults_;
};
