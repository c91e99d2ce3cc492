///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "formatting.hpp"
#include "run_options.hpp"
#include "opencl_solver.hpp"
#include <exception>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the OpenCL-seeded annealing solver.
 *
 * Scores --batch random starts on the OpenCL device, anneals from the best
 * one on the CPU, and prints the result and the per-day schedule.
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

    try {
        OpenCLSeededAnnealingSolver solver(options.config, options.batchSize);

        std::cout << "========================================\n";
        std::cout << "OPENCL-SEEDED EXAM TIMETABLING SOLVER\n";
        std::cout << "Device: " << solver.deviceName() << "\n";
        std::cout << "Exams: " << inst.numExams
                  << " | Students: " << inst.numStudents
                  << " | Slots: " << inst.numSlots
                  << " | Rooms: " << inst.numRooms << "\n";
        std::cout << "Random starts: " << options.batchSize
                  << " | Seed: " << options.config.seed << "\n";
        std::cout << "========================================\n";

        SolveResult result = solver.solve(inst);

        if (solver.lastChosenStart() >= 0) {
            std::cout << "Best random start: #" << solver.lastChosenStart()
                      << " (cost " << solver.lastStartCosts()[solver.lastChosenStart()] << ")\n";
        }

        printSolveReport(std::cout, inst, result);
        if (result.assignment && !result.assignment->empty()) {
            std::cout << "\nSchedule:\n";
            printSlotSchedule(std::cout, inst, *result.assignment, options.config.rules);
        }

        std::cout << "========================================\n";
        return result.feasible() ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 2;
    }
}
