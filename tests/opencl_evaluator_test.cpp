///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "opencl_solver.hpp"
#include "constraints.hpp"
#include "demo_instances.hpp"
#include "random_source.hpp"
#include "gtest/gtest.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
/// Skips every test when the machine has no usable OpenCL device.
class OpenCLEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            clctx_ = std::make_unique<ExamOpenCLContext>();
        } catch (const std::runtime_error& ex) {
            GTEST_SKIP() << "no OpenCL device: " << ex.what();
        }
    }

    std::unique_ptr<ExamOpenCLContext> clctx_;
};


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
TEST_F(OpenCLEvaluatorTest, DeviceCostsMatchCpuEvaluator) {
    for (DemoSize size : {DemoSize::S, DemoSize::M, DemoSize::L}) {
        ProblemDescription inst = makeDemoInstance(size);
        IncidenceIndex index = buildIncidenceIndex(inst);
        SolverConfig config;
        CandidateSet candidates = buildCandidates(inst, index, config.rules);
        CostEvaluator evaluator(inst, index, config.rules, config.weights);

        Mt19937Source rng(11);
        std::vector<Assignment> batch;
        for (int i = 0; i < 64; ++i) {
            batch.push_back(drawRandomAssignment(candidates, rng));
        }

        std::vector<int> costs;
        clctx_->evaluateBatch(inst, index, config.rules, config.weights, batch, costs);
        ASSERT_EQ(costs.size(), batch.size());
        for (size_t i = 0; i < batch.size(); ++i) {
            EXPECT_EQ(costs[i], evaluator.cost(batch[i])) << "assignment " << i;
        }
    }
}

TEST_F(OpenCLEvaluatorTest, DoubleBookedRoomMatchesCpuEvaluator) {
    ProblemDescription inst;
    inst.numStudents = 1;
    inst.numExams = 3;
    inst.numSlots = 4;
    inst.numRooms = 1;
    inst.roomCapacities = {5};
    inst.examStudentPairs = {{0, 0}, {1, 0}, {2, 0}};
    IncidenceIndex index = buildIncidenceIndex(inst);
    TimetableRules rules;
    PenaltyWeights weights;

    std::vector<Assignment> batch = {
            {{0, 1}, {0, 1}, {0, 1}},
            {{0, 0}, {0, 2}, {0, 3}}
    };
    std::vector<int> costs;
    clctx_->evaluateBatch(inst, index, rules, weights, batch, costs);

    CostEvaluator evaluator(inst, index, rules, weights);
    EXPECT_EQ(costs[0], evaluator.cost(batch[0]));
    EXPECT_EQ(costs[1], evaluator.cost(batch[1]));
}

TEST_F(OpenCLEvaluatorTest, RejectsIncompleteAssignment) {
    ProblemDescription inst = makeDemoInstance(DemoSize::S);
    IncidenceIndex index = buildIncidenceIndex(inst);
    std::vector<Assignment> batch(1, Assignment{{0, 0}});
    std::vector<int> costs;
    EXPECT_THROW(clctx_->evaluateBatch(inst, index, TimetableRules(), PenaltyWeights(), batch, costs),
                 std::invalid_argument);
}


///////////////////////////
///    SEEDED SOLVER    ///
///////////////////////////
TEST_F(OpenCLEvaluatorTest, SeededSolverStartsFromCheapestDraw) {
    ProblemDescription inst = makeDemoInstance(DemoSize::M);
    SolverConfig config;
    config.schedule.maxIterations = 1000;

    OpenCLSeededAnnealingSolver solver(config, 32);
    SolveResult first = solver.solve(inst);

    const std::vector<int>& starts = solver.lastStartCosts();
    ASSERT_EQ(starts.size(), 32u);
    int chosen = solver.lastChosenStart();
    for (int i = 0; i < (int)starts.size(); ++i) {
        EXPECT_GE(starts[i], starts[chosen]);
        if (i < chosen) EXPECT_GT(starts[i], starts[chosen]);
    }
    EXPECT_LE(first.bestCost, starts[chosen]);

    SolveResult second = solver.solve(inst);
    EXPECT_EQ(solver.lastChosenStart(), chosen);
    EXPECT_EQ(first.bestCost, second.bestCost);
    EXPECT_EQ(*first.assignment, *second.assignment);
}

TEST_F(OpenCLEvaluatorTest, ElapsedTimeCoversDeviceScoring) {
    ProblemDescription inst = makeDemoInstance(DemoSize::XL);
    SolverConfig config;
    config.schedule.maxIterations = 0;
    OpenCLSeededAnnealingSolver solver(config, 2048);

    auto start = std::chrono::steady_clock::now();
    SolveResult result = solver.solve(inst);
    auto end = std::chrono::steady_clock::now();
    double wallMs = std::chrono::duration<double, std::milli>(end - start).count();

    // With no annealing iterations almost all of the work is the batch.
    EXPECT_EQ(result.iterations, 0);
    EXPECT_LE(result.elapsedMs, wallMs);
    EXPECT_GE(result.elapsedMs, 0.5 * wallMs);
}

TEST_F(OpenCLEvaluatorTest, SeededSolverReportsStructuralFailure) {
    ProblemDescription inst;
    inst.numStudents = 2;
    inst.numExams = 1;
    inst.numSlots = 4;
    inst.numRooms = 1;
    inst.roomCapacities = {1};
    inst.examStudentPairs = {{0, 0}, {0, 1}};

    OpenCLSeededAnnealingSolver solver(SolverConfig(), 8);
    SolveResult result = solver.solve(inst);
    EXPECT_EQ(result.reason, FailureReason::STRUCTURAL_INFEASIBILITY);
    EXPECT_EQ(solver.lastChosenStart(), -1);
    EXPECT_TRUE(solver.lastStartCosts().empty());
}
