///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "model.hpp"
#include "random_source.hpp"
#include "solver_config.hpp"
#include "scripted_source.hpp"
#include "gtest/gtest.h"

#include <utility>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Instance whose exam e is sat by students listed in students[e].
ProblemDescription makeInstance(int numSlots, std::vector<int> capacities,
                                const std::vector<std::vector<int>>& students) {
    ProblemDescription inst;
    inst.numExams = (int)students.size();
    inst.numSlots = numSlots;
    inst.numRooms = (int)capacities.size();
    inst.roomCapacities = std::move(capacities);
    for (int e = 0; e < inst.numExams; ++e) {
        for (int s : students[e]) {
            inst.examStudentPairs.emplace_back(e, s);
            if (s + 1 > inst.numStudents) inst.numStudents = s + 1;
        }
    }
    return inst;
}

std::vector<int> range(int from, int to) {
    std::vector<int> ids;
    for (int i = from; i < to; ++i) ids.push_back(i);
    return ids;
}

/// Owns everything a CostEvaluator refers to.
struct EvaluatorFixture {
    ProblemDescription inst;
    IncidenceIndex index;
    TimetableRules rules;
    PenaltyWeights weights;

    EvaluatorFixture(ProblemDescription instance, TimetableRules r = TimetableRules())
            : inst(std::move(instance)),
              index(buildIncidenceIndex(inst)),
              rules(r) {}

    CostBreakdown breakdown(const Assignment& assignment) const {
        return CostEvaluator(inst, index, rules, weights).breakdown(assignment);
    }

    int cost(const Assignment& assignment) const {
        return CostEvaluator(inst, index, rules, weights).cost(assignment);
    }
};

void expectOnly(const CostBreakdown& b, int CostBreakdown::*field, int expected) {
    int CostBreakdown::*all[] = {
            &CostBreakdown::roomDouble, &CostBreakdown::clash, &CostBreakdown::minGap,
            &CostBreakdown::dayCap, &CostBreakdown::turnaround, &CostBreakdown::lastSlot,
            &CostBreakdown::invigilator
    };
    for (auto member : all) {
        EXPECT_EQ(b.*member, member == field ? expected : 0);
    }
}

} // namespace


///////////////////////////
///     CANDIDATES      ///
///////////////////////////
TEST(CandidatesTest, RoomMajorOrderWithCapacityFilter) {
    ProblemDescription inst = makeInstance(3, {1, 3, 2}, {{0, 1}});
    IncidenceIndex index = buildIncidenceIndex(inst);

    CandidateSet candidates = buildCandidates(inst, index, TimetableRules());
    ASSERT_EQ(candidates.size(), 1u);

    std::vector<Placement> expected = {
            {1, 0}, {1, 1}, {1, 2},
            {2, 0}, {2, 1}, {2, 2}
    };
    EXPECT_EQ(candidates[0], expected);
    EXPECT_EQ(firstExamWithoutCandidates(candidates), -1);
}

TEST(CandidatesTest, LargeExamSkipsLastSlotOfEachDay) {
    ProblemDescription inst = makeInstance(8, {20}, {range(0, 10), {10}});
    IncidenceIndex index = buildIncidenceIndex(inst);

    CandidateSet candidates = buildCandidates(inst, index, TimetableRules());
    ASSERT_EQ(candidates[0].size(), 6u);
    for (const Placement& p : candidates[0]) {
        EXPECT_NE(p.slot, 3);
        EXPECT_NE(p.slot, 7);
    }
    // Small exams may use every slot.
    EXPECT_EQ(candidates[1].size(), 8u);
}

TEST(CandidatesTest, ReportsFirstBlockedExam) {
    ProblemDescription inst = makeInstance(4, {3}, {{0}, range(1, 6), range(6, 11)});
    IncidenceIndex index = buildIncidenceIndex(inst);

    CandidateSet candidates = buildCandidates(inst, index, TimetableRules());
    EXPECT_FALSE(candidates[0].empty());
    EXPECT_TRUE(candidates[1].empty());
    EXPECT_EQ(firstExamWithoutCandidates(candidates), 1);
}

TEST(CandidatesTest, LargeExamWithOneSlotPerDayIsBlocked) {
    ProblemDescription inst = makeInstance(4, {50}, {range(0, 12)});
    IncidenceIndex index = buildIncidenceIndex(inst);
    TimetableRules rules;
    rules.slotsPerDay = 1;

    CandidateSet candidates = buildCandidates(inst, index, rules);
    EXPECT_EQ(firstExamWithoutCandidates(candidates), 0);
}

TEST(CandidatesTest, DrawTakesOneIndexPerExamInOrder) {
    CandidateSet candidates = {
            {{0, 0}, {0, 1}, {0, 2}},
            {{1, 5}},
            {{0, 3}, {1, 3}}
    };
    ScriptedSource rng({2, 0, 1}, {});

    Assignment assignment = drawRandomAssignment(candidates, rng);
    Assignment expected = {{0, 2}, {1, 5}, {1, 3}};
    EXPECT_EQ(assignment, expected);
    EXPECT_TRUE(isCandidateAssignment(candidates, assignment));
}

TEST(CandidatesTest, DetectsNonCandidatePlacement) {
    CandidateSet candidates = {{{0, 0}, {0, 1}}, {{1, 1}}};
    EXPECT_TRUE(isCandidateAssignment(candidates, {{0, 1}, {1, 1}}));
    EXPECT_FALSE(isCandidateAssignment(candidates, {{0, 1}, {0, 1}}));
    EXPECT_FALSE(isCandidateAssignment(candidates, {{0, 1}}));
}


///////////////////////////
///        COST         ///
///////////////////////////
TEST(CostEvaluatorTest, CleanAssignmentCostsZero) {
    EvaluatorFixture f(makeInstance(8, {5}, {{0, 1}, {2}}));
    Assignment assignment = {{0, 0}, {0, 2}};

    EXPECT_EQ(f.cost(assignment), 0);
    expectOnly(f.breakdown(assignment), &CostBreakdown::clash, 0);
}

TEST(CostEvaluatorTest, RoomDoubleBookingAlsoBreaksTurnaround) {
    EvaluatorFixture f(makeInstance(8, {5}, {{0}, {1}, {2}}));
    Assignment assignment = {{0, 4}, {0, 4}, {0, 4}};

    CostBreakdown b = f.breakdown(assignment);
    EXPECT_EQ(b.roomDouble, 10 * 2);
    // Sorted slots 4,4,4 give two adjacent gaps of zero.
    EXPECT_EQ(b.turnaround, 6 * 2);
    EXPECT_EQ(b.clash, 0);
    EXPECT_EQ(b.minGap, 0);
    EXPECT_EQ(b.invigilator, 0);
    EXPECT_EQ(f.cost(assignment), 32);
}

TEST(CostEvaluatorTest, SameSlotPairIsClashAndMinGap) {
    EvaluatorFixture f(makeInstance(8, {5, 5}, {{0}, {0}}));
    Assignment assignment = {{0, 2}, {1, 2}};

    CostBreakdown b = f.breakdown(assignment);
    EXPECT_EQ(b.clash, 10);
    EXPECT_EQ(b.minGap, 6);
    EXPECT_EQ(b.total(), 16);
}

TEST(CostEvaluatorTest, AdjacentSlotsBreakMinGapOnly) {
    EvaluatorFixture f(makeInstance(8, {5, 5}, {{0}, {0}}));
    expectOnly(f.breakdown({{0, 1}, {1, 2}}), &CostBreakdown::minGap, 6);
    EXPECT_EQ(f.cost({{0, 0}, {1, 2}}), 0);
}

TEST(CostEvaluatorTest, DailyOverloadCountsExamsAboveTwo) {
    TimetableRules rules;
    rules.minGap = 0;
    EvaluatorFixture f(makeInstance(8, {5, 5, 5, 5}, {{0}, {0}, {0}, {0}}), rules);

    // Four exams for student 0 on day 0.
    expectOnly(f.breakdown({{0, 0}, {1, 1}, {2, 2}, {3, 3}}), &CostBreakdown::dayCap, 8 * 2);
    // Two per day is allowed.
    EXPECT_EQ(f.cost({{0, 0}, {1, 1}, {2, 4}, {3, 5}}), 0);
}

TEST(CostEvaluatorTest, RoomTurnaroundPerAdjacentUse) {
    EvaluatorFixture f(makeInstance(8, {5}, {{0}, {1}, {2}}));
    expectOnly(f.breakdown({{0, 0}, {0, 1}, {0, 2}}), &CostBreakdown::turnaround, 6 * 2);
    EXPECT_EQ(f.cost({{0, 0}, {0, 2}, {0, 4}}), 0);
}

TEST(CostEvaluatorTest, LargeExamInLastSlot) {
    EvaluatorFixture f(makeInstance(8, {10}, {range(0, 10)}));
    expectOnly(f.breakdown({{0, 3}}), &CostBreakdown::lastSlot, 12);
    EXPECT_EQ(f.cost({{0, 2}}), 0);
}

TEST(CostEvaluatorTest, InvigilatorExcessIsWeightedPerUnit) {
    EvaluatorFixture f(makeInstance(4, {5, 5, 5, 5, 5, 5},
                                    {{0}, {1}, {2}, {3}, {4}, {5}}));
    Assignment assignment;
    for (int r = 0; r < 6; ++r) assignment.push_back({r, 1});

    // Demand 6 * 2 = 12 against capacity 10.
    expectOnly(f.breakdown(assignment), &CostBreakdown::invigilator, 8 * 2);
}

TEST(CostEvaluatorTest, LargeExamsNeedThreeInvigilators) {
    EvaluatorFixture f(makeInstance(4, {30, 30, 30, 30}, {range(0, 10), range(10, 20), range(20, 30), {30}}));
    EXPECT_EQ(CostEvaluator(f.inst, f.index, f.rules, f.weights).examinerDemand(0), 3);
    EXPECT_EQ(CostEvaluator(f.inst, f.index, f.rules, f.weights).examinerDemand(3), 2);

    // 3 + 3 + 3 + 2 = 11 in slot 0.
    expectOnly(f.breakdown({{0, 0}, {1, 0}, {2, 0}, {3, 0}}), &CostBreakdown::invigilator, 8);
}

TEST(CostEvaluatorTest, CostIsPureAndMatchesBreakdown) {
    EvaluatorFixture f(makeInstance(8, {4, 4}, {{0, 1}, {1, 2}, {0, 2}, {3}}));
    CostEvaluator evaluator(f.inst, f.index, f.rules, f.weights);
    Assignment assignment = {{0, 0}, {0, 0}, {1, 1}, {1, 3}};
    Assignment copy = assignment;

    int first = evaluator.cost(assignment);
    int second = evaluator.cost(assignment);
    EXPECT_EQ(first, second);
    EXPECT_EQ(evaluator.breakdown(assignment).total(), first);
    EXPECT_EQ(assignment, copy);
    EXPECT_GT(first, 0);
}

TEST(CostEvaluatorTest, ZeroWeightsSilenceTheirClass) {
    EvaluatorFixture f(makeInstance(8, {5, 5}, {{0}, {0}}));
    f.weights.clash = 0;
    f.weights.minGap = 0;
    EXPECT_EQ(f.cost({{0, 2}, {1, 2}}), 0);
}
