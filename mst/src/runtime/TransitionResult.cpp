#include "runtime/TransitionResult.h"
#include "common/JsonUtils.h"

namespace MST {

std::optional<TransitionPhase> TransitionResult::getFailedPhase() const {
    for (const auto &phaseResult : phaseResults) {
        if (!phaseResult.success) {
            return phaseResult.phase;
        }
    }
    return std::nullopt;
}

const PhaseResult *TransitionResult::getPhaseResult(TransitionPhase phase) const {
    for (const auto &phaseResult : phaseResults) {
        if (phaseResult.phase == phase) {
            return &phaseResult;
        }
    }
    return nullptr;
}

StateSet TransitionResult::applyTo(const StateSet &active) const {
    if (!success) {
        return active;
    }
    StateSet result = active.difference(deactivatedStates);
    result.insertAll(activatedStates);
    return result;
}

Json::Value TransitionResult::toJson() const {
    Json::Value json(Json::objectValue);
    json["transition_id"] = transitionId;
    json["success"] = success;

    Json::Value phases(Json::arrayValue);
    for (const auto &phaseResult : phaseResults) {
        Json::Value phase(Json::objectValue);
        phase["phase"] = toString(phaseResult.phase);
        phase["success"] = phaseResult.success;
        phase["message"] = phaseResult.message;
        phase["data"] = phaseResult.data;
        phases.append(phase);
    }
    json["phases"] = phases;

    json["activated"] = JsonUtils::toArray(activatedStates.ids());
    json["deactivated"] = JsonUtils::toArray(deactivatedStates.ids());
    json["shown"] = JsonUtils::toArray(shownStates.ids());
    json["hidden"] = JsonUtils::toArray(hiddenStates.ids());
    if (hasError()) {
        json["error"] = errorMessage;
    }
    json["metadata"] = metadata;
    return json;
}

}  // namespace MST
