#pragma once

#include "runtime/ICallbackRegistry.h"
#include <map>
#include <string>
#include <utility>

namespace MST {

/**
 * @brief Map-backed ICallbackRegistry
 *
 * Registration happens during configuration; lookups are const and may run
 * from several executors once registration is finished.
 */
class CallbackRegistry : public ICallbackRegistry {
public:
    CallbackRegistry() = default;
    ~CallbackRegistry() override = default;

    /**
     * @brief Register (or replace) the outgoing action of a transition
     */
    void registerOutgoing(const std::string &transitionId, TransitionAction action);

    /**
     * @brief Register (or replace) the incoming action run when the transition activates the state
     */
    void registerIncoming(const std::string &transitionId, const std::string &stateId, TransitionAction action);

    TransitionAction getOutgoing(const std::string &transitionId) const override;
    TransitionAction getIncoming(const std::string &transitionId, const std::string &stateId) const override;

    bool hasOutgoing(const std::string &transitionId) const;
    bool hasIncoming(const std::string &transitionId, const std::string &stateId) const;

    size_t size() const {
        return outgoing_.size() + incoming_.size();
    }

    void clear();

private:
    std::map<std::string, TransitionAction> outgoing_;
    std::map<std::pair<std::string, std::string>, TransitionAction> incoming_;
};

}  // namespace MST
