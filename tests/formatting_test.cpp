///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "gtest/gtest.h"

#include <sstream>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

ProblemDescription makeTwoExams() {
    ProblemDescription inst;
    inst.numStudents = 2;
    inst.numExams = 2;
    inst.numSlots = 8;
    inst.numRooms = 2;
    inst.roomCapacities = {5, 5};
    inst.examStudentPairs = {{0, 0}, {1, 1}};
    return inst;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace


///////////////////////////
///       REPORTS       ///
///////////////////////////
TEST(FormattingTest, FeasibleReportListsPlacements) {
    SolveResult result;
    result.status = SolveStatus::FEASIBLE;
    result.assignment = Assignment{{1, 0}, {0, 5}};
    result.elapsedMs = 1.5;

    std::ostringstream out;
    printSolveReport(out, makeTwoExams(), result);
    EXPECT_EQ(out.str(),
              "runtime_ms: 1.500\n"
              "sat\n"
              "exam 0: room 1, slot 0\n"
              "exam 1: room 0, slot 5\n");
}

TEST(FormattingTest, ExhaustedReportCarriesBestEffort) {
    SolveResult result;
    result.status = SolveStatus::INFEASIBLE;
    result.reason = FailureReason::SEARCH_EXHAUSTED;
    result.assignment = Assignment{{0, 2}, {0, 2}};
    result.bestCost = 16;
    result.iterations = 20000;

    std::ostringstream out;
    printSolveReport(out, makeTwoExams(), result);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "unsat\n"));
    EXPECT_TRUE(contains(text, "reason: search exhausted\n"));
    EXPECT_TRUE(contains(text, "iterations: 20000\n"));
    EXPECT_TRUE(contains(text, "best cost: 16\n"));
    EXPECT_TRUE(contains(text, "best-effort assignment:\nexam 0: room 0, slot 2\n"));
    EXPECT_FALSE(contains(text, "sat\nexam"));
}

TEST(FormattingTest, StructuralReportNamesBlockedExam) {
    SolveResult result;
    result.status = SolveStatus::INFEASIBLE;
    result.reason = FailureReason::STRUCTURAL_INFEASIBILITY;
    result.blockedExam = 1;

    std::ostringstream out;
    printSolveReport(out, makeTwoExams(), result);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "reason: structural infeasibility\n"));
    EXPECT_TRUE(contains(text, "blocked exam: 1\n"));
    EXPECT_FALSE(contains(text, "iterations"));
}

TEST(FormattingTest, ReasonLabels) {
    EXPECT_EQ(formatReason(FailureReason::NONE), "none");
    EXPECT_EQ(formatReason(FailureReason::STRUCTURAL_INFEASIBILITY), "structural infeasibility");
    EXPECT_EQ(formatReason(FailureReason::SEARCH_EXHAUSTED), "search exhausted");
}


///////////////////////////
///      SCHEDULES      ///
///////////////////////////
TEST(FormattingTest, ScheduleGroupsSlotsByDay) {
    TimetableRules rules;
    Assignment assignment = {{1, 0}, {0, 5}};

    std::ostringstream out;
    printSlotSchedule(out, makeTwoExams(), assignment, rules);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "Day 1:"));
    EXPECT_TRUE(contains(text, "Day 2:"));
    EXPECT_FALSE(contains(text, "Day 3:"));
    EXPECT_TRUE(contains(text, "R1: E0"));
    EXPECT_TRUE(contains(text, "R0: E1"));
    EXPECT_TRUE(contains(text, "(free)"));
    EXPECT_LT(text.find("R1: E0"), text.find("Day 2:"));
    EXPECT_GT(text.find("R0: E1"), text.find("Day 2:"));
}

TEST(FormattingTest, BreakdownEndsWithTotal) {
    CostBreakdown breakdown;
    breakdown.clash = 10;
    breakdown.minGap = 6;

    std::ostringstream out;
    printCostBreakdown(out, breakdown);
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "student clash        : 10\n"));
    EXPECT_TRUE(contains(text, "total                : 16\n"));
}
