///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_solver.hpp"
#include "formatting.hpp"
#include "run_options.hpp"
#include <mpi.h>
#include <exception>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads annealing solver.
 *
 * Every rank parses the same arguments and loads the same instance, then all
 * ranks run MPIHybridMultiStartSolver. Rank 0 prints the configuration and the
 * best result found across the job.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    RunOptions options;
    ProblemDescription inst;
    try {
        options = parseRunOptions(argc, argv);
        inst = loadInstance(options);
        validateProblem(inst);
    } catch (const std::exception& ex) {
        // Every rank sees the same input, so every rank fails the same way.
        if (rank == 0) {
            std::cerr << "error: " << ex.what() << "\n";
        }
        MPI_Finalize();
        return 2;
    }

    // Only rank 0 prints a brief header about the MPI configuration.
    if (rank == 0) {
        std::cout << "========================================\n";
        std::cout << "MPI+THREADS EXAM TIMETABLING SOLVER\n";
        std::cout << "Processes: " << size
                  << " | Chains per process: " << options.threads << "\n";
        std::cout << "Exams: " << inst.numExams
                  << " | Students: " << inst.numStudents
                  << " | Slots: " << inst.numSlots
                  << " | Rooms: " << inst.numRooms << "\n";
        std::cout << "========================================\n";
    }

    MPIHybridMultiStartSolver solver(options.config, options.threads);

    // All ranks participate; rank 0 gets the best result.
    auto resultOpt = solver.solve(inst);

    int exitCode = 0;
    if (rank == 0 && resultOpt) {
        printSolveReport(std::cout, inst, *resultOpt);
        if (resultOpt->assignment && !resultOpt->assignment->empty()) {
            std::cout << "\nSchedule:\n";
            printSlotSchedule(std::cout, inst, *resultOpt->assignment, options.config.rules);
        }
        std::cout << "========================================\n";
        exitCode = resultOpt->feasible() ? 0 : 1;
    }

    MPI_Finalize();
    return exitCode;
}
