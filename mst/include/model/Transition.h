#pragma once

#include "common/types.h"
#include "model/StateGroup.h"
#include "model/StateSet.h"
#include <functional>
#include <json/json.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace MST {

class TransitionBuilder;

/**
 * @brief Nullary action run during transition execution; false means failure
 */
using TransitionAction = std::function<bool()>;

/**
 * @brief Declarative description of a state-set delta
 *
 * A transition fires when at least one of its source states is active (an
 * empty source set fires from any configuration). Firing removes the resolved
 * exit set and adds the resolved activate set, where each resolved set is the
 * individual states united with the members of the listed groups.
 *
 * Instances are created through TransitionBuilder and are immutable afterwards.
 * Group members are read when the resolved sets are requested, so membership
 * edits made through StateRegistry after build() are honored.
 */
class Transition {
public:
    /**
     * @brief Construction token only TransitionBuilder can create
     */
    class BuildKey {
        friend class TransitionBuilder;
        BuildKey() = default;
    };

    explicit Transition(BuildKey) {}

    const std::string &getId() const {
        return id_;
    }

    const std::string &getName() const {
        return name_;
    }

    const StateSet &getFromStates() const {
        return fromStates_;
    }

    const StateSet &getActivateStates() const {
        return activateStates_;
    }

    const StateSet &getExitStates() const {
        return exitStates_;
    }

    const std::vector<ConstStateGroupPtr> &getActivateGroups() const {
        return activateGroups_;
    }

    const std::vector<ConstStateGroupPtr> &getExitGroups() const {
        return exitGroups_;
    }

    double getCost() const {
        return cost_;
    }

    VisibilityDirective getVisibility() const {
        return visibility_;
    }

    const TransitionAction &getAction() const {
        return action_;
    }

    bool hasAction() const {
        return static_cast<bool>(action_);
    }

    /**
     * @return Inline incoming action for the state, empty when none is set
     */
    TransitionAction getIncomingAction(const std::string &stateId) const;

    const std::map<std::string, TransitionAction> &getIncomingActions() const {
        return incomingActions_;
    }

    const Json::Value &getMetadata() const {
        return metadata_;
    }

    bool isWildcard() const {
        return fromStates_.empty();
    }

    /**
     * @brief Source precondition: wildcard, or some source state is active
     */
    bool canFire(const StateSet &active) const;

    /**
     * @brief Individual activate states united with all activate-group members
     */
    StateSet getStatesToActivate() const;

    /**
     * @brief Individual exit states united with all exit-group members
     */
    StateSet getStatesToExit() const;

    /**
     * @brief Configuration after firing: (active - statesToExit) + statesToActivate
     */
    StateSet project(const StateSet &active) const;

    /**
     * @brief Plain id/name/cost/flag map for logging and debugging
     */
    Json::Value toJson() const;

private:
    friend class TransitionBuilder;

    std::string id_;
    std::string name_;
    StateSet fromStates_;
    StateSet activateStates_;
    StateSet exitStates_;
    std::vector<ConstStateGroupPtr> activateGroups_;
    std::vector<ConstStateGroupPtr> exitGroups_;
    TransitionAction action_;
    std::map<std::string, TransitionAction> incomingActions_;
    double cost_ = 1.0;
    VisibilityDirective visibility_ = VisibilityDirective::INHERIT;
    Json::Value metadata_{Json::objectValue};
};

using TransitionPtr = std::shared_ptr<const Transition>;

}  // namespace MST
