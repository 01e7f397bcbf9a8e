#include "model/TransitionBuilder.h"
#include "common/Logger.h"
#include <cmath>
#include <memory>
#include <stdexcept>

namespace MST {

TransitionBuilder::TransitionBuilder(const std::string &id) : id_(id) {}

TransitionBuilder &TransitionBuilder::withName(const std::string &name) {
    name_ = name;
    return *this;
}

TransitionBuilder &TransitionBuilder::from(const ConstStatePtr &state) {
    hasNullReference_ |= !state;
    fromStates_.insert(state);
    return *this;
}

TransitionBuilder &TransitionBuilder::from(const StateSet &states) {
    fromStates_.insertAll(states);
    return *this;
}

TransitionBuilder &TransitionBuilder::activate(const ConstStatePtr &state) {
    hasNullReference_ |= !state;
    activateStates_.insert(state);
    return *this;
}

TransitionBuilder &TransitionBuilder::activate(const StateSet &states) {
    activateStates_.insertAll(states);
    return *this;
}

TransitionBuilder &TransitionBuilder::exit(const ConstStatePtr &state) {
    hasNullReference_ |= !state;
    exitStates_.insert(state);
    return *this;
}

TransitionBuilder &TransitionBuilder::exit(const StateSet &states) {
    exitStates_.insertAll(states);
    return *this;
}

TransitionBuilder &TransitionBuilder::activateGroup(const ConstStateGroupPtr &group) {
    hasNullReference_ |= !group;
    if (group) {
        activateGroups_.push_back(group);
    }
    return *this;
}

TransitionBuilder &TransitionBuilder::exitGroup(const ConstStateGroupPtr &group) {
    hasNullReference_ |= !group;
    if (group) {
        exitGroups_.push_back(group);
    }
    return *this;
}

TransitionBuilder &TransitionBuilder::withAction(TransitionAction action) {
    action_ = std::move(action);
    return *this;
}

TransitionBuilder &TransitionBuilder::withIncomingAction(const std::string &stateId, TransitionAction action) {
    incomingActions_[stateId] = std::move(action);
    return *this;
}

TransitionBuilder &TransitionBuilder::withCost(double cost) {
    cost_ = cost;
    return *this;
}

TransitionBuilder &TransitionBuilder::withVisibility(VisibilityDirective visibility) {
    visibility_ = visibility;
    return *this;
}

TransitionBuilder &TransitionBuilder::withMetadata(const std::string &key, const Json::Value &value) {
    metadata_[key] = value;
    return *this;
}

TransitionPtr TransitionBuilder::build() const {
    if (id_.empty()) {
        throw std::invalid_argument("Transition id cannot be empty");
    }
    if (!std::isfinite(cost_) || cost_ < 0.0) {
        throw std::invalid_argument("Transition " + id_ + ": cost must be a finite non-negative number");
    }
    if (hasNullReference_) {
        throw std::invalid_argument("Transition " + id_ + ": null state or group reference");
    }

    auto transition = std::make_shared<Transition>(Transition::BuildKey());
    transition->id_ = id_;
    transition->name_ = name_.empty() ? id_ : name_;
    transition->fromStates_ = fromStates_;
    transition->activateStates_ = activateStates_;
    transition->exitStates_ = exitStates_;
    transition->activateGroups_ = activateGroups_;
    transition->exitGroups_ = exitGroups_;
    transition->action_ = action_;
    transition->incomingActions_ = incomingActions_;
    transition->cost_ = cost_;
    transition->visibility_ = visibility_;
    transition->metadata_ = metadata_;

    StateSet statesToActivate = transition->getStatesToActivate();
    for (const auto &entry : incomingActions_) {
        if (!statesToActivate.contains(entry.first)) {
            LOG_WARN("Transition {}: incoming action for {} will never run, state is not activated", id_,
                     entry.first);
        }
    }

    LOG_DEBUG("Built transition {}: from={} activate={} exit={} cost={}", id_, fromStates_.toString(),
              statesToActivate.toString(), transition->getStatesToExit().toString(), cost_);
    return transition;
}

}  // namespace MST
