#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include <ostream>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Short label for a failure reason ("structural infeasibility", ...).
std::string formatReason(FailureReason reason);

/**
 * @brief Print the outcome in the plain-text result format.
 *
 *   runtime_ms: 12.345
 *   sat
 *   exam 0: room 1, slot 3
 *
 * or "unsat" followed by the reason and, when the search ran, the best cost
 * and best-effort placements.
 */
void printSolveReport(std::ostream& out, const ProblemDescription& inst, const SolveResult& result);

/// Per-day tables, one row per slot listing the exams in each room.
void printSlotSchedule(std::ostream& out, const ProblemDescription& inst,
                       const Assignment& assignment, const TimetableRules& rules);

/// One line per violation class.
void printCostBreakdown(std::ostream& out, const CostBreakdown& breakdown);
