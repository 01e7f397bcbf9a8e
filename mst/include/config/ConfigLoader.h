#pragma once

#include "pathfinding/PathFinderConfig.h"
#include "runtime/ExecutorConfig.h"
#include "runtime/ReliabilityTracker.h"
#include <json/json.h>
#include <optional>
#include <string>

namespace MST {

/**
 * @brief Settings of the executor, the path finder and the reliability tracker
 */
struct MultiStateConfig {
    ExecutorConfig executor;
    PathFinderConfig pathfinder;
    ReliabilityConfig reliability;
};

/**
 * @brief Loads MultiStateConfig from JSON
 *
 * Layout (every section and key optional, defaults apply when missing):
 * @code
 * {
 *   "executor":    { "success_policy": "threshold", "success_threshold": 0.66,
 *                    "validate_group_atomicity": true },
 *   "pathfinder":  { "strategy": "a_star", "max_expanded_nodes": 100000,
 *                    "max_search_seconds": 5.0 },
 *   "reliability": { "cost_multiplier_on_failure": 2.0, "min_cost_multiplier": 1.0,
 *                    "max_cost_multiplier": 10.0 }
 * }
 * @endcode
 *
 * Unknown keys are ignored. A key with the wrong type or an out-of-range value
 * rejects the whole document.
 */
class ConfigLoader {
public:
    static std::optional<MultiStateConfig> loadFromString(const std::string &jsonText,
                                                          std::string *errorOut = nullptr);

    static std::optional<MultiStateConfig> loadFromFile(const std::string &filePath, std::string *errorOut = nullptr);

    static std::optional<MultiStateConfig> loadFromJson(const Json::Value &root, std::string *errorOut = nullptr);

    static Json::Value toJson(const MultiStateConfig &config);

private:
    static bool readExecutor(const Json::Value &section, ExecutorConfig &config, std::string &error);
    static bool readPathFinder(const Json::Value &section, PathFinderConfig &config, std::string &error);
    static bool readReliability(const Json::Value &section, ReliabilityConfig &config, std::string &error);
};

}  // namespace MST
