#include "pathfinding/PathTypes.h"
#include "common/JsonUtils.h"

namespace MST {

bool Path::isComplete() const {
    return targets.isSubsetOf(getReachedTargets(statesSequence.empty() ? 0 : statesSequence.size() - 1));
}

StateSet Path::getReachedTargets(size_t step) const {
    StateSet reached;
    for (size_t i = 0; i < statesSequence.size() && i <= step; ++i) {
        reached.insertAll(statesSequence[i].intersection(targets));
    }
    return reached;
}

Json::Value Path::toJson() const {
    Json::Value json(Json::objectValue);

    Json::Value transitions(Json::arrayValue);
    for (const auto &transition : transitionsSequence) {
        transitions.append(transition->getId());
    }
    json["transitions"] = transitions;

    Json::Value states(Json::arrayValue);
    for (const auto &configuration : statesSequence) {
        states.append(JsonUtils::toArray(configuration.ids()));
    }
    json["states"] = states;

    json["targets"] = JsonUtils::toArray(targets.ids());
    json["total_cost"] = totalCost;
    json["length"] = static_cast<Json::UInt64>(getLength());
    json["complete"] = isComplete();
    return json;
}

std::string Path::toString() const {
    if (transitionsSequence.empty()) {
        return "<empty>";
    }
    std::string result;
    for (const auto &transition : transitionsSequence) {
        if (!result.empty()) {
            result += " -> ";
        }
        result += transition->getId();
    }
    return result;
}

std::string toString(SearchStatus status) {
    switch (status) {
    case SearchStatus::FOUND:
        return "found";
    case SearchStatus::NO_PATH:
        return "no_path";
    case SearchStatus::BUDGET_EXHAUSTED:
        return "budget_exhausted";
    case SearchStatus::INVALID_INPUT:
        return "invalid_input";
    }
    return "unknown";
}

Json::Value SearchStatistics::toJson() const {
    Json::Value json(Json::objectValue);
    json["strategy"] = toString(strategy);
    json["expanded_nodes"] = static_cast<Json::UInt64>(expandedNodes);
    json["generated_nodes"] = static_cast<Json::UInt64>(generatedNodes);
    json["elapsed_seconds"] = elapsed.count();
    return json;
}

PathSearchResult PathSearchResult::found(Path path, const SearchStatistics &statistics) {
    PathSearchResult result;
    result.status = SearchStatus::FOUND;
    result.path = std::move(path);
    result.statistics = statistics;
    return result;
}

PathSearchResult PathSearchResult::noPath(const SearchStatistics &statistics) {
    PathSearchResult result;
    result.status = SearchStatus::NO_PATH;
    result.statistics = statistics;
    return result;
}

PathSearchResult PathSearchResult::budgetExhausted(const SearchStatistics &statistics, const std::string &reason) {
    PathSearchResult result;
    result.status = SearchStatus::BUDGET_EXHAUSTED;
    result.statistics = statistics;
    result.errorMessage = reason;
    return result;
}

PathSearchResult PathSearchResult::invalidInput(const SearchStatistics &statistics, const std::string &reason) {
    PathSearchResult result;
    result.status = SearchStatus::INVALID_INPUT;
    result.statistics = statistics;
    result.errorMessage = reason;
    return result;
}

Json::Value PathSearchResult::toJson() const {
    Json::Value json(Json::objectValue);
    json["status"] = toString(status);
    json["path"] = path ? path->toJson() : Json::Value(Json::nullValue);
    json["statistics"] = statistics.toJson();
    if (!errorMessage.empty()) {
        json["error"] = errorMessage;
    }
    return json;
}

}  // namespace MST
