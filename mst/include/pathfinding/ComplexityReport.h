#pragma once

#include <cstddef>
#include <json/json.h>
#include <string>

namespace MST {

/**
 * @brief Theoretical size of the multi-target search space
 *
 * Counts are doubles; they become infinity once 2^n leaves the double range.
 */
struct ComplexityReport {
    size_t numStates = 0;
    size_t numTargets = 0;
    double stateConfigurations = 1.0;          // 2^numStates
    double targetProgressConfigurations = 1.0;  // 2^numTargets
    double totalSearchSpace = 1.0;             // Product of the two above
    std::string complexityClass;

    Json::Value toJson() const;
};

/**
 * @brief Search-space estimate for monitoring, not used by the search itself
 */
ComplexityReport estimateComplexity(size_t numStates, size_t numTargets);

}  // namespace MST
