///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "run_options.hpp"
#include <exception>
#include <iostream>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the single-chain annealing solver.
 *
 * Loads an instance file (or a demo instance), runs one annealing chain,
 * prints the result block, and for any returned assignment also the per-day
 * schedule and the violation breakdown.
 */
int main(int argc, char** argv) {
    RunOptions options;
    ProblemDescription inst;
    try {
        options = parseRunOptions(argc, argv);
        inst = loadInstance(options);
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 2;
    }

    std::cout << "========================================\n";
    std::cout << "SEQUENTIAL EXAM TIMETABLING SOLVER\n";
    std::cout << "Exams: " << inst.numExams
              << " | Students: " << inst.numStudents
              << " | Slots: " << inst.numSlots
              << " | Rooms: " << inst.numRooms << "\n";
    std::cout << "Seed: " << options.config.seed
              << " | Iterations: " << options.config.schedule.maxIterations << "\n";
    std::cout << "========================================\n";

    SolveResult result;
    try {
        SequentialAnnealingSolver solver(options.config);
        result = solver.solve(inst);
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 2;
    }

    printSolveReport(std::cout, inst, result);

    // Diagnostics: where everything landed and which rules still bite.
    if (result.assignment && !result.assignment->empty()) {
        IncidenceIndex index = buildIncidenceIndex(inst);
        CostEvaluator evaluator(inst, index, options.config.rules, options.config.weights);

        std::cout << "\nSchedule:\n";
        printSlotSchedule(std::cout, inst, *result.assignment, options.config.rules);
        std::cout << "\nViolation breakdown:\n";
        printCostBreakdown(std::cout, evaluator.breakdown(*result.assignment));
    }

    std::cout << "========================================\n";
    return result.feasible() ? 0 : 1;
}
