#include "model/Transition.h"
#include "common/JsonUtils.h"

namespace MST {

TransitionAction Transition::getIncomingAction(const std::string &stateId) const {
    auto it = incomingActions_.find(stateId);
    return it != incomingActions_.end() ? it->second : TransitionAction{};
}

bool Transition::canFire(const StateSet &active) const {
    return fromStates_.empty() || fromStates_.intersects(active);
}

StateSet Transition::getStatesToActivate() const {
    StateSet states = activateStates_;
    for (const auto &group : activateGroups_) {
        states.insertAll(group->getStates());
    }
    return states;
}

StateSet Transition::getStatesToExit() const {
    StateSet states = exitStates_;
    for (const auto &group : exitGroups_) {
        states.insertAll(group->getStates());
    }
    return states;
}

StateSet Transition::project(const StateSet &active) const {
    StateSet result = active.difference(getStatesToExit());
    result.insertAll(getStatesToActivate());
    return result;
}

Json::Value Transition::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id_;
    json["name"] = name_;
    json["from_states"] = JsonUtils::toArray(fromStates_.ids());
    json["activate_states"] = JsonUtils::toArray(activateStates_.ids());
    json["exit_states"] = JsonUtils::toArray(exitStates_.ids());

    Json::Value activateGroups(Json::arrayValue);
    for (const auto &group : activateGroups_) {
        activateGroups.append(group->getId());
    }
    json["activate_groups"] = activateGroups;

    Json::Value exitGroups(Json::arrayValue);
    for (const auto &group : exitGroups_) {
        exitGroups.append(group->getId());
    }
    json["exit_groups"] = exitGroups;

    json["cost"] = cost_;
    json["visibility"] = toString(visibility_);
    json["has_action"] = hasAction();

    Json::Value incoming(Json::arrayValue);
    for (const auto &entry : incomingActions_) {
        incoming.append(entry.first);
    }
    json["incoming_actions"] = incoming;
    json["metadata"] = metadata_;
    return json;
}

}  // namespace MST
