#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Final verdict of a solve call.
 */
enum class SolveStatus { FEASIBLE, INFEASIBLE };

/**
 * @brief Why an INFEASIBLE verdict was reached.
 */
enum class FailureReason {
    NONE, ///< Search succeeded.
    STRUCTURAL_INFEASIBILITY, ///< Some exam has no eligible (room, slot); search never ran.
    SEARCH_EXHAUSTED ///< Iteration budget consumed with a positive best cost.
};

/**
 * @brief Outcome of one solve call.
 *
 * A FEASIBLE result always carries the zero-cost assignment. An INFEASIBLE
 * result carries the best assignment found when the search ran, for
 * diagnostics only.
 */
struct SolveResult {
    SolveStatus status = SolveStatus::INFEASIBLE;
    FailureReason reason = FailureReason::NONE;

    /// Satisfying assignment (FEASIBLE) or best-effort assignment (SEARCH_EXHAUSTED).
    std::optional<Assignment> assignment;

    int bestCost = 0; ///< Cost of assignment; 0 when FEASIBLE.
    int iterations = 0; ///< Sampling iterations consumed.
    int blockedExam = -1; ///< First exam without candidates (STRUCTURAL_INFEASIBILITY only).
    double elapsedMs = 0.0; ///< Wall-clock time, for reporting only.

    /// Best cost after each iteration (only when SolverConfig::recordTrace).
    std::vector<int> bestCostTrace;

    bool feasible() const { return status == SolveStatus::FEASIBLE; }
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for exam timetable solvers.
 *
 * Implementations may run one chain or several chains on threads, but all
 * expose the same solve() contract and are deterministic for a fixed seed.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Solve the given problem instance.
     *
     * @throws InputContractViolation if the instance breaks its input contract.
     */
    virtual SolveResult solve(const ProblemDescription& inst) = 0;
};
