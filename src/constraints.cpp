///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>
#include <cstdlib>


///////////////////////////
///     CANDIDATES      ///
///////////////////////////
/**
 * @brief Enumerate eligible (room, slot) pairs for each exam.
 *
 * Rooms are scanned in index order and slots in increasing order, so the
 * candidate order is stable across runs and platforms.
 */
CandidateSet buildCandidates(const ProblemDescription& inst,
                             const IncidenceIndex& index,
                             const TimetableRules& rules) {
    CandidateSet candidates(inst.numExams);
    for (int e = 0; e < inst.numExams; ++e) {
        int size = index.examSize[e];
        bool large = rules.isLargeExam(size);
        for (int r = 0; r < inst.numRooms; ++r) {
            // Capacity fit.
            if (size > inst.roomCapacities[r]) continue;
            for (int t = 0; t < inst.numSlots; ++t) {
                // Large exams never go into the last slot of a day.
                if (large && rules.isLastSlotOfDay(t)) continue;
                candidates[e].push_back({r, t});
            }
        }
    }
    return candidates;
}

int firstExamWithoutCandidates(const CandidateSet& candidates) {
    for (int e = 0; e < (int)candidates.size(); ++e) {
        if (candidates[e].empty()) return e;
    }
    return -1;
}

Assignment drawRandomAssignment(const CandidateSet& candidates, IRandomSource& rng) {
    Assignment assignment(candidates.size());
    for (size_t e = 0; e < candidates.size(); ++e) {
        const auto& options = candidates[e];
        assignment[e] = options[rng.uniformIndex((int)options.size())];
    }
    return assignment;
}

bool isCandidateAssignment(const CandidateSet& candidates, const Assignment& assignment) {
    if (assignment.size() != candidates.size()) return false;
    for (size_t e = 0; e < candidates.size(); ++e) {
        const auto& options = candidates[e];
        if (std::find(options.begin(), options.end(), assignment[e]) == options.end()) {
            return false;
        }
    }
    return true;
}


///////////////////////////
///        COST         ///
///////////////////////////
CostEvaluator::CostEvaluator(const ProblemDescription& inst,
                             const IncidenceIndex& index,
                             const TimetableRules& rules,
                             const PenaltyWeights& weights)
        : inst_(inst),
          index_(index),
          rules_(rules),
          weights_(weights) {}

int CostEvaluator::examinerDemand(int exam) const {
    return rules_.isLargeExam(index_.examSize[exam]) ? rules_.largeExamDemand
                                                     : rules_.regularExamDemand;
}

int CostEvaluator::cost(const Assignment& assignment) const {
    return breakdown(assignment).total();
}

/**
 * @brief Evaluate every violation class from scratch.
 */
CostBreakdown CostEvaluator::breakdown(const Assignment& assignment) const {
    CostBreakdown out;
    out.roomDouble = roomDoublePenalty(assignment);
    addStudentPenalties(assignment, out);
    out.turnaround = turnaroundPenalty(assignment);
    out.lastSlot = lastSlotPenalty(assignment);
    out.invigilator = invigilatorPenalty(assignment);
    return out;
}

/**
 * @brief Room double-booking: k exams sharing a (room, slot) cost k-1 units.
 */
int CostEvaluator::roomDoublePenalty(const Assignment& assignment) const {
    int numRooms = inst_.numRooms;
    int numSlots = inst_.numSlots;

    // occupancy[room * T + slot] = number of exams placed there.
    std::vector<int> occupancy((size_t)numRooms * numSlots, 0);
    for (const Placement& p : assignment) {
        occupancy[(size_t)p.room * numSlots + p.slot]++;
    }

    int penalty = 0;
    for (int count : occupancy) {
        if (count > 1) {
            penalty += weights_.roomDouble * (count - 1);
        }
    }
    return penalty;
}

/**
 * @brief Student clash, minimum gap and daily cap penalties.
 *
 * Each unordered pair of one student's exams is checked once. A same-slot pair
 * is both a clash and a minimum gap violation.
 */
void CostEvaluator::addStudentPenalties(const Assignment& assignment, CostBreakdown& out) const {
    std::vector<int> perDay;

    for (const auto& exams : index_.examsByStudent) {
        if (exams.empty()) continue;

        // CLASH + MIN GAP
        for (size_t i = 0; i < exams.size(); ++i) {
            int t1 = assignment[exams[i]].slot;
            for (size_t j = i + 1; j < exams.size(); ++j) {
                int t2 = assignment[exams[j]].slot;
                if (t1 == t2) {
                    out.clash += weights_.clash;
                }
                if (std::abs(t1 - t2) <= rules_.minGap) {
                    out.minGap += weights_.minGap;
                }
            }
        }

        // DAILY CAP
        perDay.clear();
        for (int e : exams) {
            int day = rules_.dayOf(assignment[e].slot);
            if (day >= (int)perDay.size()) perDay.resize(day + 1, 0);
            perDay[day]++;
        }
        for (int count : perDay) {
            if (count > rules_.maxExamsPerDay) {
                out.dayCap += weights_.dayCap * (count - rules_.maxExamsPerDay);
            }
        }
    }
}

/**
 * @brief Room turnaround: consecutive uses of a room must be far enough apart.
 *
 * The slots used in a room are sorted; every adjacent pair at most
 * turnaroundGap apart counts once (including double-booked slots).
 */
int CostEvaluator::turnaroundPenalty(const Assignment& assignment) const {
    std::vector<std::vector<int>> slotsByRoom(inst_.numRooms);
    for (const Placement& p : assignment) {
        slotsByRoom[p.room].push_back(p.slot);
    }

    int penalty = 0;
    for (auto& slots : slotsByRoom) {
        std::sort(slots.begin(), slots.end());
        for (size_t i = 1; i < slots.size(); ++i) {
            if (slots[i] - slots[i - 1] <= rules_.turnaroundGap) {
                penalty += weights_.turnaround;
            }
        }
    }
    return penalty;
}

int CostEvaluator::lastSlotPenalty(const Assignment& assignment) const {
    int penalty = 0;
    for (int e = 0; e < (int)assignment.size(); ++e) {
        if (rules_.isLargeExam(index_.examSize[e]) &&
            rules_.isLastSlotOfDay(assignment[e].slot)) {
            penalty += weights_.lastSlot;
        }
    }
    return penalty;
}

/**
 * @brief Invigilator capacity: per-slot demand above examinerCapacity.
 */
int CostEvaluator::invigilatorPenalty(const Assignment& assignment) const {
    std::vector<int> demand(inst_.numSlots, 0);
    for (int e = 0; e < (int)assignment.size(); ++e) {
        demand[assignment[e].slot] += examinerDemand(e);
    }

    int penalty = 0;
    for (int d : demand) {
        if (d > rules_.examinerCapacity) {
            penalty += weights_.invigilator * (d - rules_.examinerCapacity);
        }
    }
    return penalty;
}
