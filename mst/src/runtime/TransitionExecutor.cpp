#include "runtime/TransitionExecutor.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <chrono>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

namespace MST {

namespace {

// Runs an action, folding anything it throws into a failed outcome
bool invokeAction(const TransitionAction &action, std::string &errorMessage) {
    try {
        return action();
    } catch (const std::exception &e) {
        errorMessage = e.what();
        return false;
    } catch (...) {
        errorMessage = "unknown exception";
        return false;
    }
}

}  // namespace

TransitionExecutor::TransitionExecutor(const ExecutorConfig &config) : config_(config) {
    if (!std::isfinite(config_.successThreshold) || config_.successThreshold < 0.0 ||
        config_.successThreshold > 1.0) {
        throw std::invalid_argument("Success threshold must be within [0, 1], got " +
                                    std::to_string(config_.successThreshold));
    }
    LOG_DEBUG("TransitionExecutor: created with policy {}, threshold {}, atomicity check {}",
              toString(config_.successPolicy), config_.successThreshold,
              config_.validateGroupAtomicity ? "on" : "off");
}

bool TransitionExecutor::canExecute(const Transition &transition, const StateSet &active) const {
    return !explainRejection(transition, active).has_value();
}

std::optional<std::string> TransitionExecutor::explainRejection(const Transition &transition,
                                                                const StateSet &active) const {
    if (!transition.canFire(active)) {
        return "None of the source states " + transition.getFromStates().toString() + " is active";
    }

    if (auto veto = findBlockingVeto(transition, active)) {
        return veto;
    }

    if (config_.validateGroupAtomicity) {
        if (auto violation = findAtomicityViolation(transition, active)) {
            return violation;
        }
    }

    return std::nullopt;
}

std::optional<std::string> TransitionExecutor::findBlockingVeto(const Transition &transition,
                                                                const StateSet &active) const {
    const StateSet &statesToActivate = transition.getStatesToActivate();

    for (const auto &[stateId, state] : active) {
        if (!state->isBlocking()) {
            continue;
        }

        // A blocker only lets through transitions that activate a member of its own group
        bool dismissesBlocker = false;
        if (state->hasGroup()) {
            for (const auto &[activateId, activateState] : statesToActivate) {
                if (activateState->getGroup() == state->getGroup()) {
                    dismissesBlocker = true;
                    break;
                }
            }
        }

        if (!dismissesBlocker) {
            return "Blocked by active blocking state '" + stateId + "'";
        }
    }

    return std::nullopt;
}

std::optional<std::string> TransitionExecutor::findAtomicityViolation(const Transition &transition,
                                                                      const StateSet &active) const {
    std::map<std::string, ConstStateGroupPtr> touchedGroups;
    for (const auto &group : transition.getActivateGroups()) {
        touchedGroups.emplace(group->getId(), group);
    }
    for (const auto &group : transition.getExitGroups()) {
        touchedGroups.emplace(group->getId(), group);
    }

    if (registry_) {
        auto collectGroups = [&](const StateSet &states) {
            for (const auto &[stateId, state] : states) {
                if (!state->hasGroup() || touchedGroups.count(state->getGroup())) {
                    continue;
                }
                if (auto group = registry_->getGroup(state->getGroup())) {
                    touchedGroups.emplace(group->getId(), group);
                } else {
                    LOG_WARN("TransitionExecutor: state '{}' refers to unregistered group '{}'", stateId,
                             state->getGroup());
                }
            }
        };
        collectGroups(transition.getActivateStates());
        collectGroups(transition.getExitStates());
    }

    if (touchedGroups.empty()) {
        return std::nullopt;
    }

    StateSet projected = transition.project(active);
    for (const auto &[groupId, group] : touchedGroups) {
        if (!group->validateAtomicity(projected)) {
            return "Transition would leave group '" + groupId + "' partially active in " + projected.toString();
        }
    }

    return std::nullopt;
}

TransitionResult TransitionExecutor::execute(const Transition &transition, const StateSet &active,
                                             const ICallbackRegistry *callbacks) const {
    auto startTime = std::chrono::steady_clock::now();

    TransitionResult result;
    result.transitionId = transition.getId();

    TransitionPhase currentPhase = TransitionPhase::VALIDATE;
    bool completed = false;

    try {
        completed = runPhases(transition, active, callbacks, result, currentPhase);
    } catch (const std::exception &e) {
        result.error = std::current_exception();
        result.errorMessage = e.what();
        LOG_ERROR("TransitionExecutor: unexpected error in {} phase of '{}': {}", toString(currentPhase),
                  transition.getId(), e.what());
    } catch (...) {
        result.error = std::current_exception();
        result.errorMessage = "unknown exception";
        LOG_ERROR("TransitionExecutor: unknown exception in {} phase of '{}'", toString(currentPhase),
                  transition.getId());
    }

    // CLEANUP runs unconditionally
    if (result.hasError()) {
        Json::Value data(Json::objectValue);
        data["failed_phase"] = toString(currentPhase);
        result.phaseResults.emplace_back(TransitionPhase::CLEANUP, false,
                                         "Unexpected error during " + toString(currentPhase) + ": " +
                                             result.errorMessage,
                                         data);
        completed = false;
    } else {
        result.phaseResults.emplace_back(TransitionPhase::CLEANUP, true,
                                         completed ? "Transition completed" : "Transition aborted");
    }

    result.success = completed;
    if (!result.success) {
        result.activatedStates.clear();
        result.deactivatedStates.clear();
        result.shownStates.clear();
        result.hiddenStates.clear();
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;

    result.metadata["transition_id"] = transition.getId();
    result.metadata["policy"] = toString(config_.successPolicy);
    if (config_.successPolicy == SuccessPolicy::THRESHOLD) {
        result.metadata["threshold"] = config_.successThreshold;
    }
    result.metadata["elapsed_seconds"] = elapsed.count();

    if (result.success) {
        LOG_INFO("TransitionExecutor: '{}' succeeded, activated {}, deactivated {}", transition.getId(),
                 result.activatedStates.toString(), result.deactivatedStates.toString());
    } else {
        auto failedPhase = result.getFailedPhase();
        LOG_WARN("TransitionExecutor: '{}' failed in {} phase", transition.getId(),
                 failedPhase ? toString(*failedPhase) : toString(currentPhase));
    }

    notifyObserver(result, elapsed);
    return result;
}

bool TransitionExecutor::runPhases(const Transition &transition, const StateSet &active,
                                   const ICallbackRegistry *callbacks, TransitionResult &result,
                                   TransitionPhase &currentPhase) const {
    // VALIDATE
    currentPhase = TransitionPhase::VALIDATE;
    if (auto rejection = explainRejection(transition, active)) {
        LOG_DEBUG("TransitionExecutor: '{}' rejected: {}", transition.getId(), *rejection);
        result.phaseResults.emplace_back(TransitionPhase::VALIDATE, false, *rejection);
        return false;
    }
    result.phaseResults.emplace_back(TransitionPhase::VALIDATE, true, "Preconditions satisfied");

    // OUTGOING
    currentPhase = TransitionPhase::OUTGOING;
    if (!runOutgoingPhase(transition, callbacks, result)) {
        return false;
    }

    StateSet working = active;

    // ACTIVATE
    currentPhase = TransitionPhase::ACTIVATE;
    StateSet activated = transition.getStatesToActivate();
    working.insertAll(activated);
    {
        Json::Value data(Json::objectValue);
        data["states"] = JsonUtils::toArray(activated.ids());
        result.phaseResults.emplace_back(TransitionPhase::ACTIVATE, true,
                                         "Activated " + std::to_string(activated.size()) + " state(s)", data);
    }

    // INCOMING
    currentPhase = TransitionPhase::INCOMING;
    if (!runIncomingPhase(transition, activated, callbacks, result)) {
        return false;
    }

    // EXIT
    currentPhase = TransitionPhase::EXIT;
    StateSet deactivated = transition.getStatesToExit().intersection(active).difference(activated);
    working.eraseAll(deactivated);
    {
        Json::Value data(Json::objectValue);
        data["states"] = JsonUtils::toArray(deactivated.ids());
        result.phaseResults.emplace_back(TransitionPhase::EXIT, true,
                                         "Deactivated " + std::to_string(deactivated.size()) + " state(s)", data);
    }

    // VISIBILITY
    currentPhase = TransitionPhase::VISIBILITY;
    runVisibilityPhase(transition, result);

    result.activatedStates = activated;
    result.deactivatedStates = deactivated;
    LOG_DEBUG("TransitionExecutor: '{}' resulting configuration {}", transition.getId(), working.toString());
    return true;
}

bool TransitionExecutor::runOutgoingPhase(const Transition &transition, const ICallbackRegistry *callbacks,
                                          TransitionResult &result) const {
    TransitionAction action;
    std::string source = "none";
    if (callbacks) {
        action = callbacks->getOutgoing(transition.getId());
        if (action) {
            source = "registry";
        }
    }
    if (!action && transition.hasAction()) {
        action = transition.getAction();
        source = "inline";
    }

    Json::Value data(Json::objectValue);
    data["source"] = source;

    if (!action) {
        result.phaseResults.emplace_back(TransitionPhase::OUTGOING, true, "No outgoing action", data);
        return true;
    }

    std::string errorMessage;
    if (invokeAction(action, errorMessage)) {
        result.phaseResults.emplace_back(TransitionPhase::OUTGOING, true, "Outgoing action succeeded", data);
        return true;
    }

    if (!errorMessage.empty()) {
        data["error"] = errorMessage;
        LOG_WARN("TransitionExecutor: outgoing action of '{}' threw: {}", transition.getId(), errorMessage);
    }
    result.phaseResults.emplace_back(TransitionPhase::OUTGOING, false,
                                     errorMessage.empty() ? "Outgoing action returned false"
                                                          : "Outgoing action threw: " + errorMessage,
                                     data);
    return false;
}

bool TransitionExecutor::runIncomingPhase(const Transition &transition, const StateSet &activated,
                                          const ICallbackRegistry *callbacks, TransitionResult &result) const {
    std::set<std::string> succeeded;
    std::set<std::string> failed;
    Json::Value errors(Json::objectValue);

    // Every activated state gets its action invoked exactly once, failures do not stop the loop
    for (const auto &[stateId, state] : activated) {
        TransitionAction action;
        if (callbacks) {
            action = callbacks->getIncoming(transition.getId(), stateId);
        }
        if (!action) {
            action = transition.getIncomingAction(stateId);
        }

        if (!action) {
            succeeded.insert(stateId);
            continue;
        }

        std::string errorMessage;
        if (invokeAction(action, errorMessage)) {
            succeeded.insert(stateId);
        } else {
            failed.insert(stateId);
            if (!errorMessage.empty()) {
                errors[stateId] = errorMessage;
            }
            LOG_DEBUG("TransitionExecutor: incoming action for '{}' in '{}' failed{}", stateId, transition.getId(),
                      errorMessage.empty() ? std::string() : ": " + errorMessage);
        }
    }

    bool passed =
        evaluateIncomingSuccess(config_.successPolicy, config_.successThreshold, activated.size(), failed.size());

    Json::Value data(Json::objectValue);
    data["succeeded"] = JsonUtils::toArray(succeeded);
    data["failed"] = JsonUtils::toArray(failed);
    if (!errors.empty()) {
        data["errors"] = errors;
    }
    data["policy"] = toString(config_.successPolicy);

    result.metadata["incoming_failures"] = static_cast<Json::UInt64>(failed.size());

    std::string message = std::to_string(succeeded.size()) + "/" + std::to_string(activated.size()) +
                          " incoming action(s) succeeded under " + toString(config_.successPolicy) + " policy";
    result.phaseResults.emplace_back(TransitionPhase::INCOMING, passed, message, data);
    return passed;
}

void TransitionExecutor::runVisibilityPhase(const Transition &transition, TransitionResult &result) const {
    // Every listed source alternative counts, whether or not it was the active one
    StateSet survivors = transition.getFromStates().difference(transition.getStatesToExit());

    switch (transition.getVisibility()) {
    case VisibilityDirective::SHOW_SOURCE:
        result.shownStates = survivors;
        break;
    case VisibilityDirective::HIDE_SOURCE:
        result.hiddenStates = survivors;
        break;
    case VisibilityDirective::INHERIT:
        break;
    }

    Json::Value data(Json::objectValue);
    data["directive"] = toString(transition.getVisibility());
    data["show"] = JsonUtils::toArray(result.shownStates.ids());
    data["hide"] = JsonUtils::toArray(result.hiddenStates.ids());
    result.phaseResults.emplace_back(TransitionPhase::VISIBILITY, true, "Visibility directives computed", data);
}

bool TransitionExecutor::evaluateIncomingSuccess(SuccessPolicy policy, double threshold, size_t activatedCount,
                                                 size_t failedCount) {
    if (activatedCount == 0) {
        return true;
    }

    switch (policy) {
    case SuccessPolicy::STRICT:
        return failedCount == 0;
    case SuccessPolicy::LENIENT:
        return true;
    case SuccessPolicy::THRESHOLD: {
        double ratio = static_cast<double>(activatedCount - failedCount) / static_cast<double>(activatedCount);
        return ratio >= threshold;
    }
    }
    return false;
}

void TransitionExecutor::notifyObserver(const TransitionResult &result, std::chrono::duration<double> elapsed) const {
    if (!observer_) {
        return;
    }
    try {
        observer_->recordExecution(result.transitionId, result.success, elapsed);
    } catch (const std::exception &e) {
        LOG_ERROR("TransitionExecutor: execution observer failed for '{}': {}", result.transitionId, e.what());
    } catch (...) {
        LOG_ERROR("TransitionExecutor: execution observer failed for '{}' with unknown exception",
                  result.transitionId);
    }
}

}  // namespace MST
