#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_config.hpp"
#include "random_source.hpp"
#include <vector>


///////////////////////////
///     CANDIDATES      ///
///////////////////////////
/// candidates[e] = structurally eligible placements of exam e, room-major.
using CandidateSet = std::vector<std::vector<Placement>>;

/**
 * @brief Enumerate, per exam, every (room, slot) satisfying the always-hard rules.
 *
 * A placement is eligible when the room seats every student of the exam and
 * the slot is not the last of its day for a large exam. Deterministic.
 */
CandidateSet buildCandidates(const ProblemDescription& inst,
                             const IncidenceIndex& index,
                             const TimetableRules& rules);

/**
 * @brief Find the first exam with no eligible placement.
 *
 * @return Exam id, or -1 if every exam has at least one candidate.
 */
int firstExamWithoutCandidates(const CandidateSet& candidates);

/**
 * @brief Draw one uniformly random candidate per exam, in exam order.
 *
 * Requires every candidate list to be non-empty.
 */
Assignment drawRandomAssignment(const CandidateSet& candidates, IRandomSource& rng);

/**
 * @brief Check whether every placement of an assignment is one of its exam's candidates.
 */
bool isCandidateAssignment(const CandidateSet& candidates, const Assignment& assignment);


///////////////////////////
///        COST         ///
///////////////////////////
/**
 * @brief Weighted penalty of each violation class for one assignment.
 */
struct CostBreakdown {
    int roomDouble = 0; ///< Several exams in one room at one slot.
    int clash = 0; ///< Same student, same slot.
    int minGap = 0; ///< Same student, slots at most minGap apart.
    int dayCap = 0; ///< Student sits more than maxExamsPerDay exams in a day.
    int turnaround = 0; ///< Room reused within turnaroundGap slots.
    int lastSlot = 0; ///< Large exam in the last slot of a day.
    int invigilator = 0; ///< Slot demand above examiner capacity.

    int total() const {
        return roomDouble + clash + minGap + dayCap + turnaround + lastSlot + invigilator;
    }
};

/**
 * @brief Side-effect-free weighted violation cost of complete assignments.
 *
 * The cost is recomputed from scratch on every call and is zero exactly when
 * no violation class is present (given positive weights). The evaluator keeps
 * references to the instance and index, which must outlive it.
 */
class CostEvaluator {
public:
    CostEvaluator(const ProblemDescription& inst,
                  const IncidenceIndex& index,
                  const TimetableRules& rules,
                  const PenaltyWeights& weights);

    /// Total weighted cost of a complete assignment.
    int cost(const Assignment& assignment) const;

    /// Per-class penalties; breakdown(a).total() == cost(a).
    CostBreakdown breakdown(const Assignment& assignment) const;

    /// Invigilators required by an exam.
    int examinerDemand(int exam) const;

    const TimetableRules& rules() const { return rules_; }
    const PenaltyWeights& weights() const { return weights_; }

private:
    const ProblemDescription& inst_;
    const IncidenceIndex& index_;
    TimetableRules rules_;
    PenaltyWeights weights_;

    int roomDoublePenalty(const Assignment& assignment) const;

    /// Fills clash, minGap and dayCap, which are all accumulated per student.
    void addStudentPenalties(const Assignment& assignment, CostBreakdown& out) const;

    int turnaroundPenalty(const Assignment& assignment) const;
    int lastSlotPenalty(const Assignment& assignment) const;
    int invigilatorPenalty(const Assignment& assignment) const;
};
