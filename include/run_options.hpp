#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "model.hpp"
#include "solver_config.hpp"
#include <string>


///////////////////////////
///       OPTIONS       ///
///////////////////////////
/**
 * @brief Settings shared by the command-line drivers.
 *
 * Recognised flags:
 *   --instance <path>   solve an instance file instead of a demo instance
 *   --demo <size>       XS, S, M, L or XL (default M)
 *   --seed <n>          random seed (default 42)
 *   --iterations <n>    annealing budget per chain (default 20000)
 *   --threads <n>       chains per process for multi-start drivers (default 4)
 *   --batch <n>         random starts scored per OpenCL batch (default 512)
 */
struct RunOptions {
    std::string instancePath; ///< Empty means "use the demo instance".
    DemoSize demoSize = DemoSize::M;
    int threads = 4;
    int batchSize = 512;
    SolverConfig config;
};

/**
 * @brief Parse driver arguments.
 *
 * @throws std::invalid_argument for unknown flags, missing values or bad numbers.
 */
RunOptions parseRunOptions(int argc, char** argv);

/**
 * @brief Load the instance selected by the options (file or demo).
 */
ProblemDescription loadInstance(const RunOptions& options);
