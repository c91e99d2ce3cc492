///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "run_options.hpp"
#include "instance_io.hpp"
#include <limits>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static long long parseNumber(const std::string& flag, const std::string& text,
                             long long minValue, long long maxValue) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got \"" + text + "\"");
    }
    if (used != text.size() || value < minValue || value > maxValue) {
        throw std::invalid_argument(flag + " expects an integer in [" +
                                    std::to_string(minValue) + ", " + std::to_string(maxValue) +
                                    "], got \"" + text + "\"");
    }
    return value;
}


///////////////////////////
///       OPTIONS       ///
///////////////////////////
RunOptions parseRunOptions(int argc, char** argv) {
    const long long kMaxInt = std::numeric_limits<int>::max();
    RunOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--instance") {
            options.instancePath = value;
        } else if (flag == "--demo") {
            options.demoSize = parseDemoSize(value);
        } else if (flag == "--seed") {
            options.config.seed = (std::uint64_t)parseNumber(flag, value, 0, std::numeric_limits<long long>::max());
        } else if (flag == "--iterations") {
            options.config.schedule.maxIterations = (int)parseNumber(flag, value, 0, kMaxInt);
        } else if (flag == "--threads") {
            options.threads = (int)parseNumber(flag, value, 1, kMaxInt);
        } else if (flag == "--batch") {
            options.batchSize = (int)parseNumber(flag, value, 1, kMaxInt);
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }
    return options;
}

ProblemDescription loadInstance(const RunOptions& options) {
    if (!options.instancePath.empty()) {
        return readInstanceFile(options.instancePath);
    }
    return makeDemoInstance(options.demoSize);
}
