#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <istream>
#include <string>


///////////////////////////
///       READERS       ///
///////////////////////////
/**
 * @brief Parse an instance in the plain-text exam format.
 *
 * Layout:
 *   Number of students: S
 *   Number of exams: E
 *   Number of slots: T
 *   Number of rooms: R
 *   Room 0 capacity: c0      (one line per room, in order)
 *   <exam> <student>         (one incidence pair per line)
 *
 * Blank lines among the pairs are ignored. Ids are not range-checked here;
 * see validateProblem().
 *
 * @throws std::runtime_error naming the offending line on malformed input.
 */
ProblemDescription parseInstance(std::istream& in);

/**
 * @brief Open and parse an instance file.
 *
 * @throws std::runtime_error if the file cannot be opened or parsed.
 */
ProblemDescription readInstanceFile(const std::string& path);
