#include "model/StateGroup.h"
#include "common/JsonUtils.h"
#include <algorithm>
#include <stdexcept>

namespace MST {

StateGroup::StateGroup(const std::string &id, const std::string &name, const std::vector<StatePtr> &states)
    : id_(id), name_(name.empty() ? id : name) {
    if (id_.empty()) {
        throw std::invalid_argument("StateGroup id cannot be empty");
    }
    for (const auto &state : states) {
        if (!state) {
            throw std::invalid_argument("StateGroup " + id_ + ": member state cannot be null");
        }
        addMember(state);
    }
}

bool StateGroup::isFullyActive(const StateSet &active) const {
    return states_.isSubsetOf(active);
}

bool StateGroup::isFullyInactive(const StateSet &active) const {
    return !states_.intersects(active);
}

bool StateGroup::validateAtomicity(const StateSet &active) const {
    return isFullyActive(active) || isFullyInactive(active);
}

Json::Value StateGroup::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id_;
    json["name"] = name_;
    json["states"] = JsonUtils::toArray(states_.ids());
    json["metadata"] = metadata_;
    return json;
}

void StateGroup::addMember(const StatePtr &state) {
    if (states_.insert(state)) {
        members_.push_back(state);
    }
}

void StateGroup::removeMember(const std::string &stateId) {
    if (states_.erase(stateId)) {
        members_.erase(std::remove_if(members_.begin(), members_.end(),
                                      [&stateId](const StatePtr &member) { return member->getId() == stateId; }),
                       members_.end());
    }
}

}  // namespace MST
