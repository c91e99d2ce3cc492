///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <algorithm>
#include <sstream>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief Validate counts, room capacities and incidence pairs.
 *
 * Nothing is coerced: the first problem found is reported to the caller.
 */
void validateProblem(const ProblemDescription& inst) {
    if (inst.numStudents < 0 || inst.numExams < 0 ||
        inst.numSlots < 0 || inst.numRooms < 0) {
        std::stringstream ss;
        ss << "negative count (students=" << inst.numStudents
           << ", exams=" << inst.numExams
           << ", slots=" << inst.numSlots
           << ", rooms=" << inst.numRooms << ")";
        throw InputContractViolation(ss.str());
    }

    if ((int)inst.roomCapacities.size() != inst.numRooms) {
        std::stringstream ss;
        ss << "room capacity list has " << inst.roomCapacities.size()
           << " entries, expected " << inst.numRooms;
        throw InputContractViolation(ss.str());
    }

    for (int r = 0; r < inst.numRooms; ++r) {
        if (inst.roomCapacities[r] < 0) {
            std::stringstream ss;
            ss << "room " << r << " has negative capacity " << inst.roomCapacities[r];
            throw InputContractViolation(ss.str());
        }
    }

    for (const auto& pair : inst.examStudentPairs) {
        if (pair.first < 0 || pair.first >= inst.numExams) {
            std::stringstream ss;
            ss << "exam id " << pair.first << " out of range 0.." << inst.numExams - 1;
            throw InputContractViolation(ss.str());
        }
        if (pair.second < 0 || pair.second >= inst.numStudents) {
            std::stringstream ss;
            ss << "student id " << pair.second << " out of range 0.." << inst.numStudents - 1;
            throw InputContractViolation(ss.str());
        }
    }
}


///////////////////////////
///      INCIDENCE      ///
///////////////////////////
/**
 * @brief Build the incidence index with set semantics for repeated pairs.
 */
IncidenceIndex buildIncidenceIndex(const ProblemDescription& inst) {
    IncidenceIndex index;
    index.studentsByExam.assign(inst.numExams, {});
    index.examsByStudent.assign(inst.numStudents, {});

    for (const auto& pair : inst.examStudentPairs) {
        index.studentsByExam[pair.first].push_back(pair.second);
        index.examsByStudent[pair.second].push_back(pair.first);
    }

    // Collapse duplicates so each relation behaves like a set.
    auto sortUnique = [](std::vector<int>& ids) {
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    };
    for (auto& students : index.studentsByExam) sortUnique(students);
    for (auto& exams : index.examsByStudent) sortUnique(exams);

    index.examSize.resize(inst.numExams);
    for (int e = 0; e < inst.numExams; ++e) {
        index.examSize[e] = (int)index.studentsByExam[e].size();
    }
    return index;
}
