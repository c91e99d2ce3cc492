#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>


///////////////////////////
///        RULES        ///
///////////////////////////
/**
 * @brief Timetabling rules shared by the candidate generator and cost evaluator.
 *
 * Slots are grouped into days of slotsPerDay consecutive slots. A value of 0
 * disables the day structure: every slot belongs to day 0 and no slot is the
 * last of its day.
 */
struct TimetableRules {
    int slotsPerDay = 4; ///< Slots per exam day.
    int minGap = 1; ///< A student's exams must be more than minGap slots apart.
    int turnaroundGap = 1; ///< A room's uses must be more than turnaroundGap slots apart.
    int largeExamThreshold = 10; ///< Exams with at least this many students are "large".
    int examinerCapacity = 10; ///< Invigilators available in each slot.
    int maxExamsPerDay = 2; ///< Exams a student may sit on one day.
    int largeExamDemand = 3; ///< Invigilators required by a large exam.
    int regularExamDemand = 2; ///< Invigilators required by any other exam.

    int dayOf(int slot) const {
        return slotsPerDay > 0 ? slot / slotsPerDay : 0;
    }

    bool isLastSlotOfDay(int slot) const {
        return slotsPerDay > 0 && slot % slotsPerDay == slotsPerDay - 1;
    }

    bool isLargeExam(int examSize) const {
        return examSize >= largeExamThreshold;
    }
};

/**
 * @brief Penalty added per unit of each violation class.
 */
struct PenaltyWeights {
    int roomDouble = 10;
    int clash = 10;
    int minGap = 6;
    int dayCap = 8;
    int turnaround = 6;
    int lastSlot = 12;
    int invigilator = 8;
};

/**
 * @brief Annealing budget and geometric temperature schedule.
 *
 * temperature(i) = tStart * (tEnd / tStart)^(i / maxIterations)
 */
struct AnnealingSchedule {
    int maxIterations = 20000;
    double tStart = 3.0;
    double tEnd = 0.01;

    /// Lower bound applied to the temperature in the acceptance test.
    static constexpr double kMinTemperature = 1e-6;

    double temperatureAt(int iteration) const;
};


///////////////////////////
///       CONFIG        ///
///////////////////////////
/**
 * @brief Immutable solver configuration passed by value into each solver.
 */
struct SolverConfig {
    TimetableRules rules;
    PenaltyWeights weights;
    AnnealingSchedule schedule;
    std::uint64_t seed = 42; ///< Seed of the pseudo-random stream.
    bool recordTrace = false; ///< Keep the best cost after every iteration.
};

/**
 * @brief Reject configurations the search cannot run with.
 *
 * @throws std::invalid_argument for negative rules or weights, a negative
 *         iteration budget or non-positive temperatures.
 */
void validateConfig(const SolverConfig& config);
