#pragma once

#include <string>

namespace MST {

/**
 * @brief Phases of transition execution, in execution order
 */
enum class TransitionPhase {
    VALIDATE,    // Structural preconditions, no side effects
    OUTGOING,    // Outgoing action of the transition
    ACTIVATE,    // Working-set union, cannot fail
    INCOMING,    // Incoming action for every activated state
    EXIT,        // Working-set removal, cannot fail
    VISIBILITY,  // Advisory show/hide directives
    CLEANUP      // Finalization and unexpected-error capture
};

/**
 * @brief Rule turning per-state incoming outcomes into one verdict
 */
enum class SuccessPolicy {
    STRICT,    // Every incoming action must succeed
    LENIENT,   // Incoming failures are recorded only
    THRESHOLD  // Success ratio must reach the configured threshold
};

/**
 * @brief What happens to surviving source states after a transition
 */
enum class VisibilityDirective {
    SHOW_SOURCE,  // Source states stay visible
    HIDE_SOURCE,  // Source states become hidden
    INHERIT       // No directive
};

/**
 * @brief Multi-target search strategy
 */
enum class SearchStrategy {
    BFS,       // Fewest transitions
    DIJKSTRA,  // Minimum accumulated cost
    A_STAR     // Minimum cost, guided by remaining-target heuristic
};

std::string toString(TransitionPhase phase);
std::string toString(SuccessPolicy policy);
std::string toString(VisibilityDirective directive);
std::string toString(SearchStrategy strategy);

// Return false when the name is unknown; out is left untouched in that case
bool parseSuccessPolicy(const std::string &name, SuccessPolicy &out);
bool parseVisibilityDirective(const std::string &name, VisibilityDirective &out);
bool parseSearchStrategy(const std::string &name, SearchStrategy &out);

}  // namespace MST
