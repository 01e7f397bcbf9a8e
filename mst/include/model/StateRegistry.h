#pragma once

#include "model/State.h"
#include "model/StateGroup.h"
#include "model/StateSet.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace MST {

/**
 * @brief Result of a registration call
 */
struct RegistrationResult {
    bool success = false;
    std::string errorMessage;

    static RegistrationResult ok() {
        RegistrationResult result;
        result.success = true;
        return result;
    }

    static RegistrationResult conflict(const std::string &error) {
        RegistrationResult result;
        result.success = false;
        result.errorMessage = error;
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

/**
 * @brief State-by-id and group-by-id maps
 *
 * The registry is the only component that writes a state's group id. Every
 * registration is all-or-nothing: on conflict nothing is modified and the
 * returned result carries the reason.
 *
 * Intended for the configuration phase; it is not synchronized.
 */
class StateRegistry {
public:
    StateRegistry() = default;

    /**
     * @brief Register a state under its id
     *
     * Fails for null states, duplicate ids, and states that already carry a
     * group id (those must come in through registerGroup).
     */
    RegistrationResult registerState(const StatePtr &state);

    /**
     * @brief Register a group and wire its members
     *
     * Unknown members are registered as states. Fails when the group id is
     * taken, when a member id is registered for a different State object, or
     * when a member already belongs to another group.
     */
    RegistrationResult registerGroup(const StateGroupPtr &group);

    /**
     * @brief Move a registered, ungrouped state into a registered group
     */
    RegistrationResult addStateToGroup(const std::string &groupId, const std::string &stateId);

    /**
     * @brief Detach a state from its group; no-op for ungrouped states
     */
    RegistrationResult removeStateFromGroup(const std::string &stateId);

    StatePtr getState(const std::string &stateId) const;
    StateGroupPtr getGroup(const std::string &groupId) const;

    /**
     * @return The group owning the state, or nullptr when ungrouped or unknown
     */
    StateGroupPtr getGroupOf(const std::string &stateId) const;

    bool hasState(const std::string &stateId) const {
        return states_.find(stateId) != states_.end();
    }

    bool hasGroup(const std::string &groupId) const {
        return groups_.find(groupId) != groups_.end();
    }

    size_t getStateCount() const {
        return states_.size();
    }

    size_t getGroupCount() const {
        return groups_.size();
    }

    /**
     * @brief Build a StateSet from ids; unknown ids are reported and skipped
     */
    StateSet resolve(const std::vector<std::string> &stateIds) const;

    /**
     * @brief Groups whose atomicity does not hold in the configuration
     */
    std::vector<std::string> findAtomicityViolations(const StateSet &active) const;

    /**
     * @brief Cross-check state group ids against group member lists
     * @return Validation error messages (empty if consistent)
     */
    std::vector<std::string> validate() const;

private:
    std::map<std::string, StatePtr> states_;
    std::map<std::string, StateGroupPtr> groups_;
};

}  // namespace MST
