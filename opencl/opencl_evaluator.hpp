#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <string>
#include <vector>
#include "model.hpp"
#include "solver_config.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched exam timetable evaluation.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to score many complete assignments in parallel on the device.
 */
class ExamOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Prefers a GPU device and falls back to a CPU device. Also builds the
     * program containing the cost kernel.
     *
     * @throws std::runtime_error if any OpenCL setup step fails.
     */
    ExamOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~ExamOpenCLContext();

    ExamOpenCLContext(const ExamOpenCLContext&) = delete;
    ExamOpenCLContext& operator=(const ExamOpenCLContext&) = delete;

    /**
     * @brief Evaluate a batch of complete assignments on the device.
     *
     * Each element of batch is a full assignment of size inst.numExams. On
     * return costs[i] holds the weighted violation cost of batch[i], computed
     * with the same classes and weights as CostEvaluator::cost().
     */
    void evaluateBatch(
            const ProblemDescription& inst,
            const IncidenceIndex& index,
            const TimetableRules& rules,
            const PenaltyWeights& weights,
            const std::vector<Assignment>& batch,
            std::vector<int>& costs
    );

    /// Name of the selected OpenCL device.
    const std::string& deviceName() const { return deviceName_; }

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;
    std::string deviceName_;

    cl_program buildProgram(const char* src);
};
