///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

///////////////////////////
///    DEMO: TINY       ///
///////////////////////////
static ProblemDescription makeDemoTiny() {
    ProblemDescription inst;
    inst.numStudents = 1;
    inst.numExams = 1;
    inst.numSlots = 1;
    inst.numRooms = 1;
    inst.roomCapacities = {1};
    inst.examStudentPairs = {{0, 0}};

    // 1 exam, 1 room, 1 slot: the smallest satisfiable instance.
    return inst;
}

///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static ProblemDescription makeDemoSmall() {
    ProblemDescription inst;
    inst.numStudents = 6;
    inst.numExams = 4;
    inst.numSlots = 8;
    inst.numRooms = 2;
    inst.roomCapacities = {4, 6};

    // Exams 0 and 1 share students 0-2; exam 2 shares student 3 with exam 1.
    inst.examStudentPairs = {
            {0, 0}, {0, 1}, {0, 2},
            {1, 0}, {1, 1}, {1, 2}, {1, 3},
            {2, 3}, {2, 4},
            {3, 5}
    };

    // 4 exams over two days of four slots
    return inst;
}

///////////////////////////
///   DEMO: GENERATED   ///
///////////////////////////
/**
 * @brief Random-looking but reproducible instance.
 *
 * Every student sits examsPerStudent distinct exams. Room capacities are
 * spread between a quarter of the largest exam and the largest exam, so
 * the biggest room always seats every exam.
 */
static ProblemDescription makeGenerated(int numStudents, int numExams, int numSlots,
                                        int numRooms, int examsPerStudent, unsigned seed) {
    ProblemDescription inst;
    inst.numStudents = numStudents;
    inst.numExams = numExams;
    inst.numSlots = numSlots;
    inst.numRooms = numRooms;

    std::mt19937 rng(seed);
    std::vector<int> exams(numExams);
    for (int e = 0; e < numExams; ++e) exams[e] = e;

    std::vector<int> examSize(numExams, 0);
    for (int s = 0; s < numStudents; ++s) {
        std::shuffle(exams.begin(), exams.end(), rng);
        for (int k = 0; k < examsPerStudent && k < numExams; ++k) {
            inst.examStudentPairs.emplace_back(exams[k], s);
            examSize[exams[k]]++;
        }
    }

    int largest = 1;
    for (int size : examSize) largest = std::max(largest, size);

    for (int r = 0; r < numRooms; ++r) {
        int smallest = std::max(1, largest / 4);
        int capacity = numRooms == 1
                       ? largest
                       : smallest + (largest - smallest) * r / (numRooms - 1);
        inst.roomCapacities.push_back(capacity);
    }
    return inst;
}

///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
ProblemDescription makeDemoInstance(DemoSize size) {
    switch (size) {
        case DemoSize::XS: return makeDemoTiny();
        case DemoSize::S:  return makeDemoSmall();
        case DemoSize::M:  return makeGenerated(40, 12, 16, 3, 2, 1234u);
        case DemoSize::L:  return makeGenerated(120, 30, 40, 5, 3, 1235u);
        case DemoSize::XL: return makeGenerated(400, 80, 80, 8, 3, 1236u);
    }
    return makeDemoTiny();
}

DemoSize parseDemoSize(const std::string& label) {
    if (label == "XS") return DemoSize::XS;
    if (label == "S")  return DemoSize::S;
    if (label == "M")  return DemoSize::M;
    if (label == "L")  return DemoSize::L;
    if (label == "XL") return DemoSize::XL;
    throw std::invalid_argument("Unknown demo size: " + label);
}
