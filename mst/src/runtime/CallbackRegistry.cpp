#include "runtime/CallbackRegistry.h"
#include "common/Logger.h"

namespace MST {

void CallbackRegistry::registerOutgoing(const std::string &transitionId, TransitionAction action) {
    if (!action) {
        LOG_WARN("Ignoring empty outgoing action for transition {}", transitionId);
        return;
    }
    outgoing_[transitionId] = std::move(action);
}

void CallbackRegistry::registerIncoming(const std::string &transitionId, const std::string &stateId,
                                        TransitionAction action) {
    if (!action) {
        LOG_WARN("Ignoring empty incoming action for transition {}, state {}", transitionId, stateId);
        return;
    }
    incoming_[{transitionId, stateId}] = std::move(action);
}

TransitionAction CallbackRegistry::getOutgoing(const std::string &transitionId) const {
    auto it = outgoing_.find(transitionId);
    return it != outgoing_.end() ? it->second : TransitionAction{};
}

TransitionAction CallbackRegistry::getIncoming(const std::string &transitionId, const std::string &stateId) const {
    auto it = incoming_.find({transitionId, stateId});
    return it != incoming_.end() ? it->second : TransitionAction{};
}

bool CallbackRegistry::hasOutgoing(const std::string &transitionId) const {
    return outgoing_.find(transitionId) != outgoing_.end();
}

bool CallbackRegistry::hasIncoming(const std::string &transitionId, const std::string &stateId) const {
    return incoming_.find({transitionId, stateId}) != incoming_.end();
}

void CallbackRegistry::clear() {
    outgoing_.clear();
    incoming_.clear();
}

}  // namespace MST
