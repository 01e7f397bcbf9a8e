#include "config/ConfigLoader.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <cmath>
#include <fstream>
#include <sstream>

namespace MST {

namespace {

bool fail(std::string &error, const std::string &message) {
    error = message;
    return false;
}

bool readNumber(const Json::Value &section, const std::string &key, double &out, std::string &error) {
    if (!JsonUtils::hasKey(section, key)) {
        return true;
    }
    if (!section[key].isNumeric()) {
        return fail(error, "'" + key + "' must be a number");
    }
    double value = JsonUtils::getDouble(section, key, out);
    if (!std::isfinite(value)) {
        return fail(error, "'" + key + "' must be finite");
    }
    out = value;
    return true;
}

bool readPositive(const Json::Value &section, const std::string &key, double &out, std::string &error) {
    double value = out;
    if (!readNumber(section, key, value, error)) {
        return false;
    }
    if (value <= 0.0) {
        return fail(error, "'" + key + "' must be positive");
    }
    out = value;
    return true;
}

void reportError(std::string *errorOut, const std::string &message) {
    LOG_ERROR("ConfigLoader: {}", message);
    if (errorOut) {
        *errorOut = message;
    }
}

}  // namespace

std::optional<MultiStateConfig> ConfigLoader::loadFromString(const std::string &jsonText, std::string *errorOut) {
    std::string parseError;
    auto root = JsonUtils::parseJson(jsonText, &parseError);
    if (!root) {
        reportError(errorOut, "Invalid JSON: " + parseError);
        return std::nullopt;
    }
    return loadFromJson(*root, errorOut);
}

std::optional<MultiStateConfig> ConfigLoader::loadFromFile(const std::string &filePath, std::string *errorOut) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        reportError(errorOut, "Failed to open file: " + filePath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG_DEBUG("ConfigLoader: loading {}", filePath);
    return loadFromString(buffer.str(), errorOut);
}

std::optional<MultiStateConfig> ConfigLoader::loadFromJson(const Json::Value &root, std::string *errorOut) {
    if (!root.isObject()) {
        reportError(errorOut, "Configuration root must be a JSON object");
        return std::nullopt;
    }

    MultiStateConfig config;
    std::string error;

    auto readSection = [&](const char *name, auto reader, auto &target) {
        if (!JsonUtils::hasKey(root, name)) {
            return true;
        }
        const Json::Value &section = root[name];
        if (!section.isObject()) {
            error = std::string("'") + name + "' must be an object";
            return false;
        }
        if (!reader(section, target, error)) {
            error = std::string(name) + ": " + error;
            return false;
        }
        return true;
    };

    if (!readSection("executor", &ConfigLoader::readExecutor, config.executor) ||
        !readSection("pathfinder", &ConfigLoader::readPathFinder, config.pathfinder) ||
        !readSection("reliability", &ConfigLoader::readReliability, config.reliability)) {
        reportError(errorOut, error);
        return std::nullopt;
    }

    LOG_DEBUG("ConfigLoader: policy {}, strategy {}", toString(config.executor.successPolicy),
              toString(config.pathfinder.strategy));
    return config;
}

bool ConfigLoader::readExecutor(const Json::Value &section, ExecutorConfig &config, std::string &error) {
    if (JsonUtils::hasKey(section, "success_policy")) {
        if (!section["success_policy"].isString()) {
            return fail(error, "'success_policy' must be a string");
        }
        std::string name = JsonUtils::getString(section, "success_policy");
        if (!parseSuccessPolicy(name, config.successPolicy)) {
            return fail(error, "Unknown success policy '" + name + "'");
        }
    }

    if (!readNumber(section, "success_threshold", config.successThreshold, error)) {
        return false;
    }
    if (config.successThreshold < 0.0 || config.successThreshold > 1.0) {
        return fail(error, "'success_threshold' must be within [0, 1]");
    }

    if (JsonUtils::hasKey(section, "validate_group_atomicity")) {
        if (!section["validate_group_atomicity"].isBool()) {
            return fail(error, "'validate_group_atomicity' must be a boolean");
        }
        config.validateGroupAtomicity = JsonUtils::getBool(section, "validate_group_atomicity", true);
    }
    return true;
}

bool ConfigLoader::readPathFinder(const Json::Value &section, PathFinderConfig &config, std::string &error) {
    if (JsonUtils::hasKey(section, "strategy")) {
        if (!section["strategy"].isString()) {
            return fail(error, "'strategy' must be a string");
        }
        std::string name = JsonUtils::getString(section, "strategy");
        if (!parseSearchStrategy(name, config.strategy)) {
            return fail(error, "Unknown search strategy '" + name + "'");
        }
    }

    if (JsonUtils::hasKey(section, "max_expanded_nodes")) {
        if (!section["max_expanded_nodes"].isUInt64() || section["max_expanded_nodes"].asUInt64() == 0) {
            return fail(error, "'max_expanded_nodes' must be a positive integer");
        }
        config.maxExpandedNodes = static_cast<size_t>(JsonUtils::getUInt64(section, "max_expanded_nodes"));
    }

    double seconds = config.maxSearchTime.count();
    if (!readPositive(section, "max_search_seconds", seconds, error)) {
        return false;
    }
    config.maxSearchTime = std::chrono::duration<double>(seconds);
    return true;
}

bool ConfigLoader::readReliability(const Json::Value &section, ReliabilityConfig &config, std::string &error) {
    if (!readPositive(section, "cost_multiplier_on_failure", config.costMultiplierOnFailure, error) ||
        !readPositive(section, "min_cost_multiplier", config.minCostMultiplier, error) ||
        !readPositive(section, "max_cost_multiplier", config.maxCostMultiplier, error)) {
        return false;
    }
    if (config.minCostMultiplier > config.maxCostMultiplier) {
        return fail(error, "'min_cost_multiplier' exceeds 'max_cost_multiplier'");
    }
    return true;
}

Json::Value ConfigLoader::toJson(const MultiStateConfig &config) {
    Json::Value root(Json::objectValue);

    Json::Value executor(Json::objectValue);
    executor["success_policy"] = toString(config.executor.successPolicy);
    executor["success_threshold"] = config.executor.successThreshold;
    executor["validate_group_atomicity"] = config.executor.validateGroupAtomicity;
    root["executor"] = executor;

    Json::Value pathfinder(Json::objectValue);
    pathfinder["strategy"] = toString(config.pathfinder.strategy);
    pathfinder["max_expanded_nodes"] = static_cast<Json::UInt64>(config.pathfinder.maxExpandedNodes);
    pathfinder["max_search_seconds"] = config.pathfinder.maxSearchTime.count();
    root["pathfinder"] = pathfinder;

    Json::Value reliability(Json::objectValue);
    reliability["cost_multiplier_on_failure"] = config.reliability.costMultiplierOnFailure;
    reliability["min_cost_multiplier"] = config.reliability.minCostMultiplier;
    reliability["max_cost_multiplier"] = config.reliability.maxCostMultiplier;
    root["reliability"] = reliability;

    return root;
}

}  // namespace MST
