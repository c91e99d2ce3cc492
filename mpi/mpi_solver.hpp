#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "solver_config.hpp"
#include "../threads/threaded_solver.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI-based multi-start wrapper around the threaded annealing solver.
 *
 * Each rank runs its own ThreadedMultiStartSolver on the same instance with
 * seeds offset by rank * numThreads, so every chain in the job has a distinct
 * seed. Rank 0 collects the best chain across all ranks and returns it;
 * non-root ranks return std::nullopt.
 */
class MPIHybridMultiStartSolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param config     Base configuration; chain k of rank r uses seed + r * numThreads + k.
     * @param numThreads Number of chains (worker threads) inside each rank.
     */
    MPIHybridMultiStartSolver(const SolverConfig& config, int numThreads);

    /**
     * @brief Solve the problem cooperatively across all MPI ranks.
     *
     * Must be called on every MPI rank with the same instance. The global
     * winner is the rank with the lowest key (0 for feasible, best cost
     * otherwise), lowest rank on ties, so the result is reproducible.
     *
     * @return Best result on rank 0, std::nullopt on other ranks.
     */
    std::optional<SolveResult> solve(const ProblemDescription& inst);

private:
    /// Base configuration; seeds are offset per rank.
    SolverConfig config_;

    /// Number of chains run by each MPI process.
    int numThreads_;

    /**
     * @brief Serialize an assignment into a flat integer buffer.
     *
     * Encodes (room, slot) for each exam in exam order.
     */
    static void serializeAssignment(const Assignment& assignment, std::vector<int>& buffer);

    /**
     * @brief Rebuild an assignment from a buffer made by serializeAssignment().
     */
    static void deserializeAssignment(const std::vector<int>& buffer, Assignment& assignment);
};
