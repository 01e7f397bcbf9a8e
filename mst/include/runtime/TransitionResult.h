#pragma once

#include "common/types.h"
#include "model/StateSet.h"
#include <exception>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace MST {

/**
 * @brief Outcome of one execution phase
 */
struct PhaseResult {
    TransitionPhase phase = TransitionPhase::VALIDATE;
    bool success = false;
    std::string message;
    Json::Value data{Json::objectValue};

    PhaseResult() = default;

    PhaseResult(TransitionPhase p, bool s, const std::string &msg, const Json::Value &d = Json::Value(Json::objectValue))
        : phase(p), success(s), message(msg), data(d) {}
};

/**
 * @brief Structured result of TransitionExecutor::execute()
 *
 * The executor never touches the caller's configuration. On success the
 * caller commits the delta, typically through applyTo(); on failure nothing
 * is committed.
 */
struct TransitionResult {
    bool success = false;
    std::string transitionId;
    std::vector<PhaseResult> phaseResults;

    StateSet activatedStates;
    StateSet deactivatedStates;

    // Advisory visibility directives over surviving source states
    StateSet shownStates;
    StateSet hiddenStates;

    // Unexpected exception caught during CLEANUP
    std::exception_ptr error;
    std::string errorMessage;

    Json::Value metadata{Json::objectValue};

    /**
     * @return First phase reporting failure, nullopt when every attempted phase succeeded
     */
    std::optional<TransitionPhase> getFailedPhase() const;

    /**
     * @return Result of the given phase, nullptr when the phase was not attempted
     */
    const PhaseResult *getPhaseResult(TransitionPhase phase) const;

    bool hasError() const {
        return static_cast<bool>(error);
    }

    /**
     * @brief Commit the delta: (active - deactivated) + activated
     * @return The new configuration, or active unchanged when the transition failed
     */
    StateSet applyTo(const StateSet &active) const;

    Json::Value toJson() const;
};

}  // namespace MST
