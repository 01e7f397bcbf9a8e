#pragma once

#include "model/State.h"
#include <initializer_list>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace MST {

/**
 * @brief Set of states keyed by state id
 *
 * Used for active-state configurations and for the derived activate/exit sets
 * of transitions. Membership, equality and ordering depend on ids only, so two
 * sets holding different State objects with the same ids are equal.
 */
class StateSet {
public:
    using Container = std::map<std::string, ConstStatePtr>;
    using const_iterator = Container::const_iterator;

    StateSet() = default;
    StateSet(std::initializer_list<ConstStatePtr> states);

    /**
     * @brief Insert a state; null pointers are ignored
     * @return true if the id was not present before
     */
    bool insert(const ConstStatePtr &state);

    /**
     * @return true if a state with this id was removed
     */
    bool erase(const std::string &stateId);

    void insertAll(const StateSet &other);
    void eraseAll(const StateSet &other);
    void clear() {
        states_.clear();
    }

    bool contains(const std::string &stateId) const {
        return states_.find(stateId) != states_.end();
    }

    bool contains(const State &state) const {
        return contains(state.getId());
    }

    /**
     * @return The stored state, or nullptr when absent
     */
    ConstStatePtr find(const std::string &stateId) const;

    size_t size() const {
        return states_.size();
    }

    bool empty() const {
        return states_.empty();
    }

    const_iterator begin() const {
        return states_.begin();
    }

    const_iterator end() const {
        return states_.end();
    }

    bool intersects(const StateSet &other) const;
    bool isSubsetOf(const StateSet &other) const;

    StateSet unionWith(const StateSet &other) const;
    StateSet difference(const StateSet &other) const;
    StateSet intersection(const StateSet &other) const;

    std::set<std::string> ids() const;

    /**
     * @brief "{A, B, C}" rendering for log messages
     */
    std::string toString() const;

    bool operator==(const StateSet &other) const;
    bool operator!=(const StateSet &other) const {
        return !(*this == other);
    }

private:
    Container states_;
};

}  // namespace MST
