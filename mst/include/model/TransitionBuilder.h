#pragma once

#include "model/Transition.h"
#include <memory>
#include <string>

namespace MST {

/**
 * @brief Fluent construction of immutable Transition instances
 *
 * @code
 * auto openWorkspace = TransitionBuilder("open_workspace")
 *                          .from(login)
 *                          .activate(toolbar)
 *                          .activate(sidebar)
 *                          .exit(login)
 *                          .withCost(2.0)
 *                          .build();
 * @endcode
 */
class TransitionBuilder {
public:
    explicit TransitionBuilder(const std::string &id);

    TransitionBuilder &withName(const std::string &name);
    TransitionBuilder &from(const ConstStatePtr &state);
    TransitionBuilder &from(const StateSet &states);
    TransitionBuilder &activate(const ConstStatePtr &state);
    TransitionBuilder &activate(const StateSet &states);
    TransitionBuilder &exit(const ConstStatePtr &state);
    TransitionBuilder &exit(const StateSet &states);
    TransitionBuilder &activateGroup(const ConstStateGroupPtr &group);
    TransitionBuilder &exitGroup(const ConstStateGroupPtr &group);
    TransitionBuilder &withAction(TransitionAction action);
    TransitionBuilder &withIncomingAction(const std::string &stateId, TransitionAction action);
    TransitionBuilder &withCost(double cost);
    TransitionBuilder &withVisibility(VisibilityDirective visibility);
    TransitionBuilder &withMetadata(const std::string &key, const Json::Value &value);

    /**
     * @brief Validate and produce the transition
     *
     * The builder can be reused afterwards; each call returns a new instance.
     *
     * @throws std::invalid_argument for an empty id, a negative or non-finite
     *         cost, or null states/groups
     */
    TransitionPtr build() const;

private:
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
    bool hasNullReference_ = false;
};

}  // namespace MST
