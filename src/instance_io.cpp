///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "instance_io.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void parseError(int lineNo, const std::string& line, const std::string& expected) {
    std::stringstream ss;
    ss << "Instance line " << lineNo << ": could not parse \"" << line
       << "\"; expected " << expected;
    throw std::runtime_error(ss.str());
}

static bool isBlank(const std::string& line) {
    for (unsigned char c : line) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

/**
 * @brief Parse a non-empty run of decimal digits into a non-negative int.
 */
static bool parseNonNegative(const std::string& text, int& out) {
    if (text.empty() || text.size() > 9) return false;
    int value = 0;
    for (unsigned char c : text) {
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

/**
 * @brief Read one "<name>: <int>" header line.
 */
static int readAttribute(std::istream& in, int& lineNo, const std::string& name) {
    std::string line;
    ++lineNo;
    if (!std::getline(in, line)) {
        parseError(lineNo, "", "\"" + name + ": <int>\"");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::string prefix = name + ":";
    if (line.compare(0, prefix.size(), prefix) != 0) {
        parseError(lineNo, line, "\"" + name + ": <int>\"");
    }

    // Value: optional spaces, then digits up to the end of the line.
    size_t pos = prefix.size();
    while (pos < line.size() && std::isspace((unsigned char)line[pos])) ++pos;

    int value = 0;
    if (!parseNonNegative(line.substr(pos), value)) {
        parseError(lineNo, line, "\"" + name + ": <int>\"");
    }
    return value;
}


///////////////////////////
///       READERS       ///
///////////////////////////
ProblemDescription parseInstance(std::istream& in) {
    ProblemDescription inst;
    int lineNo = 0;

    inst.numStudents = readAttribute(in, lineNo, "Number of students");
    inst.numExams = readAttribute(in, lineNo, "Number of exams");
    inst.numSlots = readAttribute(in, lineNo, "Number of slots");
    inst.numRooms = readAttribute(in, lineNo, "Number of rooms");

    inst.roomCapacities.reserve(inst.numRooms);
    for (int r = 0; r < inst.numRooms; ++r) {
        std::stringstream name;
        name << "Room " << r << " capacity";
        inst.roomCapacities.push_back(readAttribute(in, lineNo, name.str()));
    }

    std::string line;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isBlank(line)) continue;

        std::istringstream fields(line);
        std::string examText, studentText, extra;
        fields >> examText >> studentText;
        int exam = 0;
        int student = 0;
        if (!parseNonNegative(examText, exam) ||
            !parseNonNegative(studentText, student) ||
            (fields >> extra)) {
            parseError(lineNo, line, "\"<exam> <student>\"");
        }
        inst.examStudentPairs.emplace_back(exam, student);
    }
    return inst;
}

ProblemDescription readInstanceFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open instance file: " + path);
    }
    return parseInstance(in);
}
