#include "common/types.h"
#include <algorithm>
#include <cctype>

namespace MST {

namespace {

std::string normalize(const std::string &name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

}  // namespace

std::string toString(TransitionPhase phase) {
    switch (phase) {
    case TransitionPhase::VALIDATE:
        return "validate";
    case TransitionPhase::OUTGOING:
        return "outgoing";
    case TransitionPhase::ACTIVATE:
        return "activate";
    case TransitionPhase::INCOMING:
        return "incoming";
    case TransitionPhase::EXIT:
        return "exit";
    case TransitionPhase::VISIBILITY:
        return "visibility";
    case TransitionPhase::CLEANUP:
        return "cleanup";
    }
    return "unknown";
}

std::string toString(SuccessPolicy policy) {
    switch (policy) {
    case SuccessPolicy::STRICT:
        return "strict";
    case SuccessPolicy::LENIENT:
        return "lenient";
    case SuccessPolicy::THRESHOLD:
        return "threshold";
    }
    return "unknown";
}

std::string toString(VisibilityDirective directive) {
    switch (directive) {
    case VisibilityDirective::SHOW_SOURCE:
        return "show_source";
    case VisibilityDirective::HIDE_SOURCE:
        return "hide_source";
    case VisibilityDirective::INHERIT:
        return "inherit";
    }
    return "unknown";
}

std::string toString(SearchStrategy strategy) {
    switch (strategy) {
    case SearchStrategy::BFS:
        return "bfs";
    case SearchStrategy::DIJKSTRA:
        return "dijkstra";
    case SearchStrategy::A_STAR:
        return "astar";
    }
    return "unknown";
}

bool parseSuccessPolicy(const std::string &name, SuccessPolicy &out) {
    const std::string key = normalize(name);
    if (key == "strict") {
        out = SuccessPolicy::STRICT;
    } else if (key == "lenient") {
        out = SuccessPolicy::LENIENT;
    } else if (key == "threshold") {
        out = SuccessPolicy::THRESHOLD;
    } else {
        return false;
    }
    return true;
}

bool parseVisibilityDirective(const std::string &name, VisibilityDirective &out) {
    const std::string key = normalize(name);
    if (key == "show_source" || key == "show") {
        out = VisibilityDirective::SHOW_SOURCE;
    } else if (key == "hide_source" || key == "hide") {
        out = VisibilityDirective::HIDE_SOURCE;
    } else if (key == "inherit") {
        out = VisibilityDirective::INHERIT;
    } else {
        return false;
    }
    return true;
}

bool parseSearchStrategy(const std::string &name, SearchStrategy &out) {
    const std::string key = normalize(name);
    if (key == "bfs") {
        out = SearchStrategy::BFS;
    } else if (key == "dijkstra") {
        out = SearchStrategy::DIJKSTRA;
    } else if (key == "astar" || key == "a_star" || key == "a*") {
        out = SearchStrategy::A_STAR;
    } else {
        return false;
    }
    return true;
}

}  // namespace MST
