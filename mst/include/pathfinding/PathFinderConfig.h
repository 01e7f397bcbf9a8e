#pragma once

#include "common/types.h"
#include <chrono>
#include <cstddef>

namespace MST {

/**
 * @brief Search parameters of a MultiTargetPathFinder
 */
struct PathFinderConfig {
    // Used when findPathToAll()/search() is called without an explicit strategy
    SearchStrategy strategy = SearchStrategy::DIJKSTRA;

    // Budget: the search stops with BUDGET_EXHAUSTED when either limit is hit
    size_t maxExpandedNodes = 1000000;
    std::chrono::duration<double> maxSearchTime{30.0};
};

}  // namespace MST
