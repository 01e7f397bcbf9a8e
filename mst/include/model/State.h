#pragma once

#include "model/Element.h"
#include <json/json.h>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace MST {

class StateRegistry;

/**
 * @brief A named collection of elements that can be active alongside other states
 *
 * Identity is the immutable id: two State objects compare equal when their ids
 * match, whatever their payload. The payload (elements, weights, blocking data,
 * metadata) stays mutable during configuration.
 *
 * Group membership is written only by StateRegistry, which keeps the state's
 * group id and the StateGroup member list consistent.
 */
class State {
public:
    /**
     * @param id Unique state identifier (must not be empty)
     * @param name Human-readable name, defaults to the id
     */
    explicit State(const std::string &id, const std::string &name = "");

    const std::string &getId() const {
        return id_;
    }

    const std::string &getName() const {
        return name_;
    }

    void addElement(const Element &element);
    void removeElement(const std::string &elementId);
    bool hasElement(const std::string &elementId) const;

    const std::map<std::string, Element> &getElements() const {
        return elements_;
    }

    /**
     * @brief Id of the owning group, empty when the state is ungrouped
     */
    const std::string &getGroup() const {
        return group_;
    }

    bool hasGroup() const {
        return !group_.empty();
    }

    /**
     * @brief Weight used when picking an initial configuration (must be >= 0)
     */
    double getInitialWeight() const {
        return initialWeight_;
    }

    void setInitialWeight(double weight);

    /**
     * @brief Cost of being in this state during search (must be >= 0)
     */
    double getSearchCost() const {
        return searchCost_;
    }

    void setSearchCost(double cost);

    /**
     * @brief A blocking state vetoes activations outside its own group while active
     */
    bool isBlocking() const {
        return blocking_;
    }

    void setBlocking(bool blocking) {
        blocking_ = blocking;
    }

    const std::set<std::string> &getBlocks() const {
        return blocks_;
    }

    void addBlockedState(const std::string &stateId) {
        blocks_.insert(stateId);
    }

    void setBlocks(const std::set<std::string> &stateIds) {
        blocks_ = stateIds;
    }

    Json::Value &getMetadata() {
        return metadata_;
    }

    const Json::Value &getMetadata() const {
        return metadata_;
    }

    /**
     * @brief Plain id/name/cost/flag map for logging and debugging
     */
    Json::Value toJson() const;

    bool operator==(const State &other) const {
        return id_ == other.id_;
    }

    bool operator<(const State &other) const {
        return id_ < other.id_;
    }

private:
    friend class StateRegistry;

    void setGroup(const std::string &groupId) {
        group_ = groupId;
    }

    const std::string id_;
    std::string name_;
    std::map<std::string, Element> elements_;
    std::string group_;
    double initialWeight_ = 1.0;
    double searchCost_ = 1.0;
    bool blocking_ = false;
    std::set<std::string> blocks_;
    Json::Value metadata_{Json::objectValue};
};

using StatePtr = std::shared_ptr<State>;
using ConstStatePtr = std::shared_ptr<const State>;

}  // namespace MST
