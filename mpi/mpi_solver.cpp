///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include <mpi.h>
#include <chrono>
#include <limits>
#include <stdexcept>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the hybrid MPI + threaded multi-start solver.
 *
 * @param config     Base configuration shared by every rank.
 * @param numThreads Number of chains run by each MPI rank.
 */
MPIHybridMultiStartSolver::MPIHybridMultiStartSolver(const SolverConfig& config, int numThreads)
        : config_(config),
          numThreads_(numThreads) {
    if (numThreads_ < 1) {
        throw std::invalid_argument("MPIHybridMultiStartSolver: numThreads must be >= 1");
    }
    validateConfig(config_);
}

/**
 * @brief Serialize an assignment into a flat integer buffer.
 *
 * Encodes each placement as two consecutive integers (room, slot), suitable
 * for MPI send/recv.
 */
void MPIHybridMultiStartSolver::serializeAssignment(const Assignment& assignment, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(2 * assignment.size());
    for (const Placement& p : assignment) {
        buffer.push_back(p.room);
        buffer.push_back(p.slot);
    }
}

/**
 * @brief Deserialize a flat integer buffer into an assignment.
 *
 * Assumes groups of two ints per exam, as produced by serializeAssignment().
 */
void MPIHybridMultiStartSolver::deserializeAssignment(const std::vector<int>& buffer, Assignment& assignment) {
    size_t count = buffer.size() / 2;
    assignment.resize(count);
    for (size_t i = 0; i < count; ++i) {
        assignment[i].room = buffer[2 * i + 0];
        assignment[i].slot = buffer[2 * i + 1];
    }
}

/**
 * @brief Solve the instance using multi-start across MPI ranks plus threads per rank.
 *
 * Each rank runs a ThreadedMultiStartSolver with its own seed block. The best
 * key (cost, rank) across all ranks is found with MPI_MINLOC; the winning rank
 * sends its assignment to rank 0, which assembles and returns the result.
 */
std::optional<SolveResult> MPIHybridMultiStartSolver::solve(const ProblemDescription& inst) {
    auto start = std::chrono::steady_clock::now();

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Distinct seed block per rank: chains never share a random stream.
    SolverConfig rankConfig = config_;
    rankConfig.seed = config_.seed + (std::uint64_t)rank * (std::uint64_t)numThreads_;

    ThreadedMultiStartSolver threadedSolver(rankConfig, numThreads_);
    SolveResult local = threadedSolver.solve(inst);

    // Ranks without a search (structural infeasibility) never win.
    const int kNoSearch = std::numeric_limits<int>::max();
    struct { int value; int rank; } localKey, globalKey;
    localKey.value = local.reason == FailureReason::STRUCTURAL_INFEASIBILITY ? kNoSearch : local.bestCost;
    localKey.rank = rank;
    MPI_Allreduce(&localKey, &globalKey, 1, MPI_2INT, MPI_MINLOC, MPI_COMM_WORLD);

    const int TAG_META = 300;
    const int TAG_DATA = 301;

    auto finish = [&](SolveResult result) {
        auto end = std::chrono::steady_clock::now();
        result.elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();
        return result;
    };

    // Case 1: no rank ran a search, or rank 0 holds the best chain.
    if (globalKey.value == kNoSearch || globalKey.rank == 0) {
        if (rank == 0) return finish(local);
        return std::nullopt;
    }

    // Case 2: a non-root rank won; ship its assignment to rank 0.
    if (rank == globalKey.rank) {
        std::vector<int> buf;
        serializeAssignment(*local.assignment, buf);
        int meta[2] = { (int)buf.size(), local.iterations };

        MPI_Send(meta, 2, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (meta[0] > 0) {
            MPI_Send(buf.data(), meta[0], MPI_INT, 0, TAG_DATA, MPI_COMM_WORLD);
        }
        return std::nullopt;
    }

    if (rank != 0) {
        return std::nullopt;
    }

    int meta[2] = {0, 0};
    MPI_Recv(meta, 2, MPI_INT, globalKey.rank, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);

    std::vector<int> buf(meta[0]);
    if (meta[0] > 0) {
        MPI_Recv(buf.data(), meta[0], MPI_INT, globalKey.rank, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    }

    Assignment assignment;
    deserializeAssignment(buf, assignment);

    SolveResult best;
    best.bestCost = globalKey.value;
    best.iterations = meta[1];
    best.assignment = std::move(assignment);
    if (best.bestCost == 0) {
        best.status = SolveStatus::FEASIBLE;
        best.reason = FailureReason::NONE;
    } else {
        best.status = SolveStatus::INFEASIBLE;
        best.reason = FailureReason::SEARCH_EXHAUSTED;
    }
    return finish(best);
}
