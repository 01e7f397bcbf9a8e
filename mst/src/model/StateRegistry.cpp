#include "model/StateRegistry.h"
#include "common/Logger.h"

namespace MST {

RegistrationResult StateRegistry::registerState(const StatePtr &state) {
    if (!state) {
        return RegistrationResult::conflict("Cannot register a null state");
    }

    const std::string &stateId = state->getId();
    if (hasState(stateId)) {
        LOG_WARN("Duplicate state id: {}", stateId);
        return RegistrationResult::conflict("State already registered: " + stateId);
    }

    if (state->hasGroup()) {
        return RegistrationResult::conflict("State " + stateId + " claims group " + state->getGroup() +
                                            " but was not registered through it");
    }

    states_.emplace(stateId, state);
    LOG_DEBUG("Registered state {}", stateId);
    return RegistrationResult::ok();
}

RegistrationResult StateRegistry::registerGroup(const StateGroupPtr &group) {
    if (!group) {
        return RegistrationResult::conflict("Cannot register a null group");
    }

    const std::string &groupId = group->getId();
    if (hasGroup(groupId)) {
        LOG_WARN("Duplicate group id: {}", groupId);
        return RegistrationResult::conflict("Group already registered: " + groupId);
    }

    // Check every member before touching anything
    for (const auto &member : group->getMembers()) {
        const std::string &stateId = member->getId();

        auto it = states_.find(stateId);
        if (it != states_.end() && it->second != member) {
            return RegistrationResult::conflict("Group " + groupId + ": state id " + stateId +
                                                " is registered for a different state object");
        }

        if (member->hasGroup() && member->getGroup() != groupId) {
            LOG_WARN("State {} already belongs to group {}, rejecting group {}", stateId, member->getGroup(),
                     groupId);
            return RegistrationResult::conflict("State " + stateId + " already belongs to group " +
                                                member->getGroup());
        }
    }

    for (const auto &member : group->getMembers()) {
        states_.emplace(member->getId(), member);
        member->setGroup(groupId);
    }
    groups_.emplace(groupId, group);

    LOG_DEBUG("Registered group {} with {} states", groupId, group->size());
    return RegistrationResult::ok();
}

RegistrationResult StateRegistry::addStateToGroup(const std::string &groupId, const std::string &stateId) {
    auto group = getGroup(groupId);
    if (!group) {
        return RegistrationResult::conflict("Unknown group: " + groupId);
    }

    auto state = getState(stateId);
    if (!state) {
        return RegistrationResult::conflict("Unknown state: " + stateId);
    }

    if (state->hasGroup()) {
        if (state->getGroup() == groupId) {
            return RegistrationResult::ok();
        }
        return RegistrationResult::conflict("State " + stateId + " already belongs to group " + state->getGroup());
    }

    group->addMember(state);
    state->setGroup(groupId);
    LOG_DEBUG("Added state {} to group {}", stateId, groupId);
    return RegistrationResult::ok();
}

RegistrationResult StateRegistry::removeStateFromGroup(const std::string &stateId) {
    auto state = getState(stateId);
    if (!state) {
        return RegistrationResult::conflict("Unknown state: " + stateId);
    }

    if (!state->hasGroup()) {
        return RegistrationResult::ok();
    }

    auto group = getGroup(state->getGroup());
    if (group) {
        group->removeMember(stateId);
    }
    state->setGroup("");
    return RegistrationResult::ok();
}

StatePtr StateRegistry::getState(const std::string &stateId) const {
    auto it = states_.find(stateId);
    return it != states_.end() ? it->second : nullptr;
}

StateGroupPtr StateRegistry::getGroup(const std::string &groupId) const {
    auto it = groups_.find(groupId);
    return it != groups_.end() ? it->second : nullptr;
}

StateGroupPtr StateRegistry::getGroupOf(const std::string &stateId) const {
    auto state = getState(stateId);
    if (!state || !state->hasGroup()) {
        return nullptr;
    }
    return getGroup(state->getGroup());
}

StateSet StateRegistry::resolve(const std::vector<std::string> &stateIds) const {
    StateSet result;
    for (const auto &stateId : stateIds) {
        auto state = getState(stateId);
        if (!state) {
            LOG_WARN("Unknown state id skipped: {}", stateId);
            continue;
        }
        result.insert(state);
    }
    return result;
}

std::vector<std::string> StateRegistry::findAtomicityViolations(const StateSet &active) const {
    std::vector<std::string> violations;
    for (const auto &[groupId, group] : groups_) {
        if (!group->validateAtomicity(active)) {
            violations.push_back(groupId);
        }
    }
    return violations;
}

std::vector<std::string> StateRegistry::validate() const {
    std::vector<std::string> errors;

    for (const auto &[stateId, state] : states_) {
        if (!state->hasGroup()) {
            continue;
        }
        auto group = getGroup(state->getGroup());
        if (!group) {
            errors.push_back("State " + stateId + " references unknown group " + state->getGroup());
        } else if (!group->hasState(stateId)) {
            errors.push_back("State " + stateId + " is not a member of its group " + state->getGroup());
        }
    }

    for (const auto &[groupId, group] : groups_) {
        for (const auto &entry : group->getStates()) {
            auto state = getState(entry.first);
            if (!state || state->getGroup() != groupId) {
                errors.push_back("Group " + groupId + " lists state " + entry.first + " without back-reference");
            }
        }
    }

    return errors;
}

}  // namespace MST
