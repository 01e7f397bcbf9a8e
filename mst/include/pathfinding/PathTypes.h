#pragma once

#include "common/types.h"
#include "model/StateSet.h"
#include "model/Transition.h"
#include <chrono>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace MST {

/**
 * @brief Transition sequence visiting every target state at least once
 *
 * statesSequence holds the start configuration followed by the configuration
 * after each transition, so it is always one longer than transitionsSequence.
 */
struct Path {
    std::vector<StateSet> statesSequence;
    std::vector<TransitionPtr> transitionsSequence;
    StateSet targets;
    double totalCost = 0.0;

    size_t getLength() const {
        return transitionsSequence.size();
    }

    /**
     * @brief True if the union of the visited configurations covers all targets
     */
    bool isComplete() const;

    /**
     * @brief Targets reached by the end of step i (0 = start configuration)
     */
    StateSet getReachedTargets(size_t step) const;

    Json::Value toJson() const;

    // "t1 -> t2 -> t3", or "<empty>" for a zero-length path
    std::string toString() const;
};

enum class SearchStatus {
    FOUND,
    NO_PATH,           // Reachable space exhausted without covering the targets
    BUDGET_EXHAUSTED,  // Expansion or time limit hit first
    INVALID_INPUT      // Too many targets, or an invalid effective cost
};

std::string toString(SearchStatus status);

struct SearchStatistics {
    SearchStrategy strategy = SearchStrategy::DIJKSTRA;
    size_t expandedNodes = 0;
    size_t generatedNodes = 0;
    std::chrono::duration<double> elapsed{0.0};

    Json::Value toJson() const;
};

/**
 * @brief Detailed outcome of MultiTargetPathFinder::search()
 */
struct PathSearchResult {
    SearchStatus status = SearchStatus::NO_PATH;
    std::optional<Path> path;
    SearchStatistics statistics;
    std::string errorMessage;

    static PathSearchResult found(Path path, const SearchStatistics &statistics);
    static PathSearchResult noPath(const SearchStatistics &statistics);
    static PathSearchResult budgetExhausted(const SearchStatistics &statistics, const std::string &reason);
    static PathSearchResult invalidInput(const SearchStatistics &statistics, const std::string &reason);

    bool isFound() const {
        return status == SearchStatus::FOUND;
    }

    Json::Value toJson() const;
};

}  // namespace MST
