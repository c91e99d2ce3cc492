#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "solver_config.hpp"
#include "opencl_evaluator.hpp"
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Annealing solver seeded from the best of many random starts.
 *
 * Draws batchSize random complete assignments from the seeded stream, scores
 * them all at once on the OpenCL device, and runs the annealing loop from the
 * cheapest one (lowest index on ties). The same stream then drives the
 * annealing, so runs are reproducible for a fixed seed and batch size.
 */
class OpenCLSeededAnnealingSolver : public ISolver {
public:
    /**
     * @brief Construct the solver and its OpenCL context.
     *
     * @param config    Annealing configuration.
     * @param batchSize Number of random starts scored on the device (>= 1).
     *
     * @throws std::runtime_error if OpenCL cannot be initialised.
     */
    OpenCLSeededAnnealingSolver(const SolverConfig& config, int batchSize);

    SolveResult solve(const ProblemDescription& inst) override;

    /// Device costs of the random starts of the last solve, in draw order.
    const std::vector<int>& lastStartCosts() const { return startCosts_; }

    /// Index of the start the annealing began from (-1 if the search did not run).
    int lastChosenStart() const { return chosenStart_; }

    const std::string& deviceName() const { return clctx_.deviceName(); }

private:
    /// Annealing configuration shared with the CPU solver.
    SolverConfig config_;

    /// Number of random starts scored per solve.
    int batchSize_;

    /// OpenCL context and kernel used for batched cost evaluation.
    ExamOpenCLContext clctx_;

    std::vector<int> startCosts_;
    int chosenStart_ = -1;
};
