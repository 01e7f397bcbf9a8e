#include "model/StateSet.h"
#include <algorithm>

namespace MST {

StateSet::StateSet(std::initializer_list<ConstStatePtr> states) {
    for (const auto &state : states) {
        insert(state);
    }
}

bool StateSet::insert(const ConstStatePtr &state) {
    if (!state) {
        return false;
    }
    return states_.emplace(state->getId(), state).second;
}

bool StateSet::erase(const std::string &stateId) {
    return states_.erase(stateId) > 0;
}

void StateSet::insertAll(const StateSet &other) {
    for (const auto &[id, state] : other.states_) {
        states_.emplace(id, state);
    }
}

void StateSet::eraseAll(const StateSet &other) {
    for (const auto &entry : other.states_) {
        states_.erase(entry.first);
    }
}

ConstStatePtr StateSet::find(const std::string &stateId) const {
    auto it = states_.find(stateId);
    return it != states_.end() ? it->second : nullptr;
}

bool StateSet::intersects(const StateSet &other) const {
    const StateSet &smaller = size() <= other.size() ? *this : other;
    const StateSet &larger = size() <= other.size() ? other : *this;
    return std::any_of(smaller.begin(), smaller.end(),
                       [&larger](const auto &entry) { return larger.contains(entry.first); });
}

bool StateSet::isSubsetOf(const StateSet &other) const {
    if (size() > other.size()) {
        return false;
    }
    return std::all_of(begin(), end(), [&other](const auto &entry) { return other.contains(entry.first); });
}

StateSet StateSet::unionWith(const StateSet &other) const {
    StateSet result(*this);
    result.insertAll(other);
    return result;
}

StateSet StateSet::difference(const StateSet &other) const {
    StateSet result(*this);
    result.eraseAll(other);
    return result;
}

StateSet StateSet::intersection(const StateSet &other) const {
    StateSet result;
    for (const auto &[id, state] : states_) {
        if (other.contains(id)) {
            result.insert(state);
        }
    }
    return result;
}

std::set<std::string> StateSet::ids() const {
    std::set<std::string> result;
    for (const auto &entry : states_) {
        result.insert(entry.first);
    }
    return result;
}

std::string StateSet::toString() const {
    std::string result = "{";
    bool first = true;
    for (const auto &entry : states_) {
        if (!first) {
            result += ", ";
        }
        result += entry.first;
        first = false;
    }
    result += "}";
    return result;
}

bool StateSet::operator==(const StateSet &other) const {
    return states_.size() == other.states_.size() &&
           std::equal(states_.begin(), states_.end(), other.states_.begin(),
                      [](const auto &lhs, const auto &rhs) { return lhs.first == rhs.first; });
}

}  // namespace MST
