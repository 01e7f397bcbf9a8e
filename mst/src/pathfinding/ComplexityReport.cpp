#include "pathfinding/ComplexityReport.h"
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace MST {

namespace {

double powerOfTwo(size_t exponent) {
    if (exponent > static_cast<size_t>(std::numeric_limits<double>::max_exponent)) {
        return std::numeric_limits<double>::infinity();
    }
    return std::ldexp(1.0, static_cast<int>(exponent));
}

// jsoncpp cannot represent infinity, so oversized counts are written as strings
Json::Value countToJson(double count, size_t exponent) {
    if (std::isfinite(count)) {
        return count;
    }
    return fmt::format("2^{}", exponent);
}

}  // namespace

Json::Value ComplexityReport::toJson() const {
    Json::Value json(Json::objectValue);
    json["num_states"] = static_cast<Json::UInt64>(numStates);
    json["num_targets"] = static_cast<Json::UInt64>(numTargets);
    json["state_configurations"] = countToJson(stateConfigurations, numStates);
    json["target_progress_configurations"] = countToJson(targetProgressConfigurations, numTargets);
    json["total_search_space"] = countToJson(totalSearchSpace, numStates + numTargets);
    json["complexity_class"] = complexityClass;
    json["exponential_in_targets"] = true;
    return json;
}

ComplexityReport estimateComplexity(size_t numStates, size_t numTargets) {
    ComplexityReport report;
    report.numStates = numStates;
    report.numTargets = numTargets;
    report.stateConfigurations = powerOfTwo(numStates);
    report.targetProgressConfigurations = powerOfTwo(numTargets);
    report.totalSearchSpace = powerOfTwo(numStates + numTargets);
    report.complexityClass = fmt::format("O(2^n * 2^k) with n={}, k={}", numStates, numTargets);
    return report;
}

}  // namespace MST
