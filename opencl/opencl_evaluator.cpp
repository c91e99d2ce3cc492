///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

/**
 * @brief Releases every buffer created during one evaluateBatch() call.
 */
struct MemObjectList {
    std::vector<cl_mem> items;

    cl_mem add(cl_mem m) {
        items.push_back(m);
        return m;
    }

    ~MemObjectList() {
        for (cl_mem m : items) {
            if (m) clReleaseMemObject(m);
        }
    }
};

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
// params layout: slotsPerDay, minGap, turnaroundGap, examinerCapacity,
// maxExamsPerDay, then the weights roomDouble, clash, minGap, dayCap,
// turnaround, lastSlot, invigilator.
static const char* EXAM_COST_KERNEL_SRC = R"(
__kernel void eval_exam_costs(
    __global const int* rooms,             // size: numCandidates*numExams
    __global const int* slots,             // size: numCandidates*numExams
    const int numCandidates,
    const int numExams,
    const int numSlots,
    const int numRooms,
    const int numStudents,
    __global const int* studentOffsets,    // size: numStudents+1
    __global const int* studentExams,      // flat exam ids per student
    __global const int* examDemand,        // size: numExams
    __global const int* examLarge,         // size: numExams
    __global const int* params,            // size: 12
    __global int* roomSlotScratch,         // size: numCandidates*numRooms*numSlots
    __global int* slotScratch,             // size: numCandidates*numSlots
    __global int* costOut
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    const int slotsPerDay    = params[0];
    const int minGap         = params[1];
    const int turnaroundGap  = params[2];
    const int examinerCap    = params[3];
    const int maxPerDay      = params[4];
    const int wRoomDouble    = params[5];
    const int wClash         = params[6];
    const int wMinGap        = params[7];
    const int wDayCap        = params[8];
    const int wTurnaround    = params[9];
    const int wLastSlot      = params[10];
    const int wInvigilator   = params[11];

    int base = cid * numExams;
    __global int* occ    = roomSlotScratch + (size_t)cid * numRooms * numSlots;
    __global int* demand = slotScratch + (size_t)cid * numSlots;

    for (int i = 0; i < numRooms * numSlots; ++i) occ[i] = 0;
    for (int t = 0; t < numSlots; ++t) demand[t] = 0;

    int cost = 0;

    // OCCUPANCY + LAST SLOT
    for (int e = 0; e < numExams; ++e) {
        int r = rooms[base + e];
        int t = slots[base + e];
        occ[r * numSlots + t] += 1;
        demand[t] += examDemand[e];
        if (examLarge[e] && slotsPerDay > 0 && (t % slotsPerDay) == slotsPerDay - 1) {
            cost += wLastSlot;
        }
    }

    // ROOM DOUBLE-BOOKING + TURNAROUND
    // Walking slots in order with multiplicity visits the sorted slot list.
    for (int r = 0; r < numRooms; ++r) {
        int prev = -1;
        for (int t = 0; t < numSlots; ++t) {
            int c = occ[r * numSlots + t];
            if (c > 1) cost += wRoomDouble * (c - 1);
            for (int k = 0; k < c; ++k) {
                if (prev >= 0 && t - prev <= turnaroundGap) cost += wTurnaround;
                prev = t;
            }
        }
    }

    // INVIGILATOR CAPACITY
    for (int t = 0; t < numSlots; ++t) {
        if (demand[t] > examinerCap) cost += wInvigilator * (demand[t] - examinerCap);
    }

    // STUDENT CLASH, MIN GAP, DAILY CAP
    int numDays = slotsPerDay > 0 ? (numSlots + slotsPerDay - 1) / slotsPerDay : 1;
    for (int s = 0; s < numStudents; ++s) {
        int start = studentOffsets[s];
        int end   = studentOffsets[s + 1];

        for (int i = start; i < end; ++i) {
            int t1 = slots[base + studentExams[i]];
            for (int j = i + 1; j < end; ++j) {
                int t2 = slots[base + studentExams[j]];
                if (t1 == t2) cost += wClash;
                int d = t1 > t2 ? t1 - t2 : t2 - t1;
                if (d <= minGap) cost += wMinGap;
            }
        }

        if (end - start <= maxPerDay) continue;
        for (int day = 0; day < numDays; ++day) {
            int c = 0;
            for (int i = start; i < end; ++i) {
                int t = slots[base + studentExams[i]];
                int examDay = slotsPerDay > 0 ? t / slotsPerDay : 0;
                if (examDay == day) c++;
            }
            if (c > maxPerDay) cost += wDayCap * (c - maxPerDay);
        }
    }

    costOut[cid] = cost;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
ExamOpenCLContext::ExamOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name) - 1, name, nullptr);
    deviceName_ = name;

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

#if CL_TARGET_OPENCL_VERSION >= 200
    cl_queue_properties props[] = { CL_QUEUE_PROPERTIES, 0, 0 };
    queue = clCreateCommandQueueWithProperties(context, device, props, &err);
#else
    queue = clCreateCommandQueue(context, device, 0, &err);
#endif
    if (err != CL_SUCCESS) {
        clReleaseContext(context);
        checkError(err, "creating command queue");
    }

    try {
        program = buildProgram(EXAM_COST_KERNEL_SRC);
    } catch (...) {
        clReleaseCommandQueue(queue);
        clReleaseContext(context);
        throw;
    }
}

ExamOpenCLContext::~ExamOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program ExamOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        clReleaseProgram(prog);
        throw std::runtime_error(std::string("Failed to build OpenCL program:\n") + log.data());
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
void ExamOpenCLContext::evaluateBatch(
        const ProblemDescription& inst,
        const IncidenceIndex& index,
        const TimetableRules& rules,
        const PenaltyWeights& weights,
        const std::vector<Assignment>& batch,
        std::vector<int>& costs
) {
    cl_int err = CL_SUCCESS;

    int numCandidates = (int)batch.size();
    costs.assign(numCandidates, 0);
    if (numCandidates == 0 || inst.numExams == 0) return;

    int numExams = inst.numExams;
    int numSlots = inst.numSlots;
    int numRooms = inst.numRooms;
    int numStudents = inst.numStudents;

    // Flatten assignments
    std::vector<int> rooms((size_t)numCandidates * numExams);
    std::vector<int> slots((size_t)numCandidates * numExams);
    for (int c = 0; c < numCandidates; ++c) {
        const Assignment& a = batch[c];
        if ((int)a.size() != numExams) {
            throw std::invalid_argument("evaluateBatch: assignment size differs from exam count");
        }
        for (int e = 0; e < numExams; ++e) {
            size_t idx = (size_t)c * numExams + e;
            rooms[idx] = a[e].room;
            slots[idx] = a[e].slot;
        }
    }

    // Flatten incidence: student -> exams (CSR layout)
    std::vector<int> studentOffsets(numStudents + 1);
    std::vector<int> studentExams;
    int offset = 0;
    for (int s = 0; s < numStudents; ++s) {
        studentOffsets[s] = offset;
        for (int e : index.examsByStudent[s]) {
            studentExams.push_back(e);
            ++offset;
        }
    }
    studentOffsets[numStudents] = offset;
    // Zero-sized buffers are not allowed.
    if (studentExams.empty()) studentExams.push_back(0);

    std::vector<int> examDemand(numExams);
    std::vector<int> examLarge(numExams);
    for (int e = 0; e < numExams; ++e) {
        bool large = rules.isLargeExam(index.examSize[e]);
        examLarge[e] = large ? 1 : 0;
        examDemand[e] = large ? rules.largeExamDemand : rules.regularExamDemand;
    }

    std::vector<int> params = {
            rules.slotsPerDay, rules.minGap, rules.turnaroundGap,
            rules.examinerCapacity, rules.maxExamsPerDay,
            weights.roomDouble, weights.clash, weights.minGap, weights.dayCap,
            weights.turnaround, weights.lastSlot, weights.invigilator
    };

    size_t bufAssignSize = (size_t)numCandidates * numExams * sizeof(int);
    size_t bufOffsetsSize = studentOffsets.size() * sizeof(int);
    size_t bufStudentExamsSize = studentExams.size() * sizeof(int);
    size_t bufExamSize = (size_t)numExams * sizeof(int);
    size_t bufParamsSize = params.size() * sizeof(int);
    size_t bufRoomSlotSize = (size_t)numCandidates * numRooms * numSlots * sizeof(int);
    size_t bufSlotSize = (size_t)numCandidates * numSlots * sizeof(int);
    size_t bufCostSize = (size_t)numCandidates * sizeof(int);

    MemObjectList mem;
    auto createBuffer = [&](cl_mem_flags flags, size_t bytes, const void* host, const char* what) {
        cl_mem m = clCreateBuffer(context, flags, bytes, const_cast<void*>(host), &err);
        checkError(err, what);
        return mem.add(m);
    };
    const cl_mem_flags kIn = CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR;

    // Upload data
    cl_mem d_rooms          = createBuffer(kIn, bufAssignSize, rooms.data(), "creating d_rooms");
    cl_mem d_slots          = createBuffer(kIn, bufAssignSize, slots.data(), "creating d_slots");
    cl_mem d_studentOffsets = createBuffer(kIn, bufOffsetsSize, studentOffsets.data(), "creating d_studentOffsets");
    cl_mem d_studentExams   = createBuffer(kIn, bufStudentExamsSize, studentExams.data(), "creating d_studentExams");
    cl_mem d_examDemand     = createBuffer(kIn, bufExamSize, examDemand.data(), "creating d_examDemand");
    cl_mem d_examLarge      = createBuffer(kIn, bufExamSize, examLarge.data(), "creating d_examLarge");
    cl_mem d_params         = createBuffer(kIn, bufParamsSize, params.data(), "creating d_params");
    cl_mem d_roomSlot       = createBuffer(CL_MEM_READ_WRITE, bufRoomSlotSize, nullptr, "creating d_roomSlot");
    cl_mem d_slot           = createBuffer(CL_MEM_READ_WRITE, bufSlotSize, nullptr, "creating d_slot");
    cl_mem d_cost           = createBuffer(CL_MEM_WRITE_ONLY, bufCostSize, nullptr, "creating d_cost");

    // Kernel + args
    cl_kernel kernel = clCreateKernel(program, "eval_exam_costs", &err);
    checkError(err, "creating kernel");

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_rooms); checkError(err, "arg rooms");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slots); checkError(err, "arg slots");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numExams); checkError(err, "arg numExams");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numSlots); checkError(err, "arg numSlots");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numRooms); checkError(err, "arg numRooms");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numStudents); checkError(err, "arg numStudents");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_studentOffsets); checkError(err, "arg studentOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_studentExams); checkError(err, "arg studentExams");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_examDemand); checkError(err, "arg examDemand");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_examLarge); checkError(err, "arg examLarge");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_params); checkError(err, "arg params");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_roomSlot); checkError(err, "arg roomSlotScratch");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slot); checkError(err, "arg slotScratch");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_cost); checkError(err, "arg costOut");

        size_t global = (size_t)numCandidates;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing eval_exam_costs");
        err = clFinish(queue);
        checkError(err, "finishing queue");

        err = clEnqueueReadBuffer(queue, d_cost, CL_TRUE, 0, bufCostSize, costs.data(), 0, nullptr, nullptr);
        checkError(err, "reading costs");
    } catch (...) {
        clReleaseKernel(kernel);
        throw;
    }

    clReleaseKernel(kernel);
}
