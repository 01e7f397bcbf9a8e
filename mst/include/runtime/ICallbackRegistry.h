#pragma once

#include "model/Transition.h"
#include <string>

namespace MST {

/**
 * @brief External source of outgoing/incoming actions, keyed by id
 *
 * Alternative to the inline actions of a Transition. When both exist, the
 * registry entry is used.
 */
class ICallbackRegistry {
public:
    virtual ~ICallbackRegistry() = default;

    /**
     * @return Outgoing action for the transition, empty when none is registered
     */
    virtual TransitionAction getOutgoing(const std::string &transitionId) const = 0;

    /**
     * @return Incoming action for the (transition, activated state) pair, empty when none is registered
     */
    virtual TransitionAction getIncoming(const std::string &transitionId, const std::string &stateId) const = 0;
};

}  // namespace MST
