#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "random_source.hpp"
#include "solver_base.hpp"
#include "solver_config.hpp"
#include <chrono>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Mutable state of one annealing run.
 *
 * Lives for a single solve() call and is never shared.
 */
struct SearchState {
    Assignment current; ///< Assignment being perturbed.
    Assignment best; ///< Lowest-cost assignment seen so far.
    int bestCost = 0; ///< Cost of best.
    int iteration = 0; ///< Iterations consumed so far.
    double temperature = 0.0; ///< Temperature of the current iteration.
    IRandomSource& rng; ///< Stream for proposals and acceptance draws.
};

/**
 * @brief Single-chain annealing solver for exam timetabling.
 *
 * Builds a random complete assignment from the per-exam candidates, then
 * relocates one exam per iteration. A move that beats the best cost is always
 * kept; any other move survives with probability exp(-(new - best) / T),
 * measured against the best cost rather than the current one. The run stops as
 * soon as the best cost reaches zero or the iteration budget is spent.
 */
class SequentialAnnealingSolver : public ISolver {
public:
    /**
     * @brief Construct a solver with a fixed configuration.
     *
     * @throws std::invalid_argument if the configuration is invalid.
     */
    explicit SequentialAnnealingSolver(const SolverConfig& config);

    /**
     * @brief Solve with a fresh Mt19937Source seeded from the configuration.
     */
    SolveResult solve(const ProblemDescription& inst) override;

    /**
     * @brief Solve drawing every random decision from the supplied stream.
     */
    SolveResult solve(const ProblemDescription& inst, IRandomSource& rng);

    /**
     * @brief Skip the random initialisation and anneal from a given assignment.
     *
     * @throws std::invalid_argument if some placement is not a candidate of its exam.
     */
    SolveResult solveFrom(const ProblemDescription& inst, const Assignment& initial, IRandomSource& rng);

    const SolverConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    SolverConfig config_;

    /**
     * @brief Shared front half of solve()/solveFrom().
     *
     * Validates the instance, handles the empty and structurally infeasible
     * cases and builds the incidence index and candidates. Returns true when
     * the search should run; otherwise result is already final.
     */
    bool prepare(const ProblemDescription& inst,
                 IncidenceIndex& index,
                 CandidateSet& candidates,
                 SolveResult& result,
                 Clock::time_point start) const;

    /**
     * @brief Sampling phase: the Metropolis loop over single-exam relocations.
     */
    SolveResult anneal(const ProblemDescription& inst,
                       const IncidenceIndex& index,
                       const CandidateSet& candidates,
                       Assignment initial,
                       IRandomSource& rng,
                       Clock::time_point start) const;
};
