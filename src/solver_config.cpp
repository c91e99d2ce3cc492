///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_config.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>


///////////////////////////
///      SCHEDULE       ///
///////////////////////////
double AnnealingSchedule::temperatureAt(int iteration) const {
    if (maxIterations <= 0) return tStart;
    double progress = (double)iteration / (double)maxIterations;
    return tStart * std::pow(tEnd / tStart, progress);
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
static void requireNonNegative(int value, const char* name) {
    if (value < 0) {
        std::stringstream ss;
        ss << "SolverConfig: " << name << " must be >= 0 (got " << value << ")";
        throw std::invalid_argument(ss.str());
    }
}

void validateConfig(const SolverConfig& config) {
    const TimetableRules& r = config.rules;
    requireNonNegative(r.slotsPerDay, "slotsPerDay");
    requireNonNegative(r.minGap, "minGap");
    requireNonNegative(r.turnaroundGap, "turnaroundGap");
    requireNonNegative(r.largeExamThreshold, "largeExamThreshold");
    requireNonNegative(r.examinerCapacity, "examinerCapacity");
    requireNonNegative(r.maxExamsPerDay, "maxExamsPerDay");
    requireNonNegative(r.largeExamDemand, "largeExamDemand");
    requireNonNegative(r.regularExamDemand, "regularExamDemand");

    const PenaltyWeights& w = config.weights;
    requireNonNegative(w.roomDouble, "weights.roomDouble");
    requireNonNegative(w.clash, "weights.clash");
    requireNonNegative(w.minGap, "weights.minGap");
    requireNonNegative(w.dayCap, "weights.dayCap");
    requireNonNegative(w.turnaround, "weights.turnaround");
    requireNonNegative(w.lastSlot, "weights.lastSlot");
    requireNonNegative(w.invigilator, "weights.invigilator");

    requireNonNegative(config.schedule.maxIterations, "schedule.maxIterations");
    if (!(config.schedule.tStart > 0.0) || !(config.schedule.tEnd > 0.0)) {
        throw std::invalid_argument("SolverConfig: temperatures must be > 0");
    }
}
