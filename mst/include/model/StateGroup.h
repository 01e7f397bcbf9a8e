#pragma once

#include "model/StateSet.h"
#include <json/json.h>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace MST {

class StateRegistry;

/**
 * @brief States that activate and deactivate as one unit
 *
 * Atomicity: for any configuration C, either every member is in C or none is.
 * Membership is fixed when the group is registered; StateRegistry wires each
 * member's group id and rejects states already owned by another group.
 */
class StateGroup {
public:
    /**
     * @param id Unique group identifier (must not be empty)
     * @param name Human-readable name, defaults to the id
     * @param states Initial members
     */
    explicit StateGroup(const std::string &id, const std::string &name = "",
                        const std::vector<StatePtr> &states = {});

    const std::string &getId() const {
        return id_;
    }

    const std::string &getName() const {
        return name_;
    }

    const StateSet &getStates() const {
        return states_;
    }

    std::set<std::string> getStateIds() const {
        return states_.ids();
    }

    bool hasState(const std::string &stateId) const {
        return states_.contains(stateId);
    }

    size_t size() const {
        return states_.size();
    }

    /**
     * @brief Every member is in the configuration
     */
    bool isFullyActive(const StateSet &active) const;

    /**
     * @brief No member is in the configuration
     */
    bool isFullyInactive(const StateSet &active) const;

    /**
     * @brief Atomicity check: fully active or fully inactive
     */
    bool validateAtomicity(const StateSet &active) const;

    Json::Value &getMetadata() {
        return metadata_;
    }

    const Json::Value &getMetadata() const {
        return metadata_;
    }

    Json::Value toJson() const;

private:
    friend class StateRegistry;

    // Mutable member handles for registry wiring; the public view stays const
    const std::vector<StatePtr> &getMembers() const {
        return members_;
    }

    void addMember(const StatePtr &state);
    void removeMember(const std::string &stateId);

    std::string id_;
    std::string name_;
    std::vector<StatePtr> members_;
    StateSet states_;
    Json::Value metadata_{Json::objectValue};
};

using StateGroupPtr = std::shared_ptr<StateGroup>;
using ConstStateGroupPtr = std::shared_ptr<const StateGroup>;

}  // namespace MST
