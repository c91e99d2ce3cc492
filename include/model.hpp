#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Complete problem instance describing the exam timetabling task.
 *
 * Produced by the instance reader (or built in code) and treated as immutable
 * by every solver.
 */
struct ProblemDescription {
    int numStudents = 0; ///< S: students are identified by 0..S-1.
    int numExams = 0; ///< E: exams are identified by 0..E-1.
    int numSlots = 0; ///< T: time slots 0..T-1, grouped into days.
    int numRooms = 0; ///< R: rooms 0..R-1.

    /// roomCapacities[r] = number of seats in room r (size must equal numRooms).
    std::vector<int> roomCapacities;

    /// (examId, studentId) incidence pairs; duplicates are tolerated.
    std::vector<std::pair<int, int>> examStudentPairs;
};

/**
 * @brief Read-only incidence mappings derived once from a ProblemDescription.
 */
struct IncidenceIndex {
    std::vector<std::vector<int>> studentsByExam; ///< Sorted, unique student ids per exam.
    std::vector<std::vector<int>> examsByStudent; ///< Sorted, unique exam ids per student.
    std::vector<int> examSize; ///< Number of distinct students sitting each exam.
};

/**
 * @brief Room and time slot given to a single exam.
 */
struct Placement {
    int room; ///< Room index (0..R-1).
    int slot; ///< Slot index (0..T-1).
};

inline bool operator==(const Placement& a, const Placement& b) {
    return a.room == b.room && a.slot == b.slot;
}

inline bool operator!=(const Placement& a, const Placement& b) {
    return !(a == b);
}

/// Complete timetable: placement of exam e is stored at index e.
using Assignment = std::vector<Placement>;


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Raised when a ProblemDescription breaks its input contract.
 *
 * Covers negative counts, a capacity list whose length differs from the room
 * count, negative capacities and out-of-range exam or student ids.
 */
class InputContractViolation : public std::invalid_argument {
public:
    explicit InputContractViolation(const std::string& what)
            : std::invalid_argument(what) {}
};


///////////////////////////
///      FUNCTIONS      ///
///////////////////////////
/**
 * @brief Check the input contract of a problem description.
 *
 * @throws InputContractViolation describing the first violation found.
 */
void validateProblem(const ProblemDescription& inst);

/**
 * @brief Build students-per-exam, exams-per-student and exam sizes.
 *
 * Assumes the instance already passed validateProblem().
 */
IncidenceIndex buildIncidenceIndex(const ProblemDescription& inst);
