#pragma once

#include "model/StateRegistry.h"
#include "model/StateSet.h"
#include "model/Transition.h"
#include "runtime/ExecutorConfig.h"
#include "runtime/ICallbackRegistry.h"
#include "runtime/IExecutionObserver.h"
#include "runtime/TransitionResult.h"
#include <memory>
#include <optional>
#include <string>

namespace MST {

/**
 * @brief Runs a single Transition through the phase protocol
 *
 * Phases: VALIDATE, OUTGOING, ACTIVATE, INCOMING, EXIT, VISIBILITY, CLEANUP.
 * One PhaseResult is appended per phase attempted. A failure in VALIDATE,
 * OUTGOING or INCOMING stops the run; CLEANUP always runs and captures any
 * exception escaping an earlier phase, so execute() never throws std::exception
 * subclasses to the caller.
 *
 * The caller's configuration is read only. Successful results carry the delta
 * that the caller commits (TransitionResult::applyTo); failed results are
 * simply not committed, which is the rollback.
 *
 * An executor holds no per-run state and can be shared, provided the
 * configured observer is thread-safe. The configuration passed to execute()
 * must not be mutated while the call is in flight.
 */
class TransitionExecutor {
public:
    /**
     * @throws std::invalid_argument if the success threshold is outside [0, 1]
     */
    explicit TransitionExecutor(const ExecutorConfig &config = ExecutorConfig());

    const ExecutorConfig &getConfig() const {
        return config_;
    }

    /**
     * @brief Registry used to resolve the groups of individually activated/exited states
     *
     * Without a registry, atomicity validation covers only the transition's own
     * activate/exit groups.
     */
    void setStateRegistry(std::shared_ptr<const StateRegistry> registry) {
        registry_ = std::move(registry);
    }

    /**
     * @brief Observer notified with (transition id, success, elapsed time) after every run
     */
    void setExecutionObserver(std::shared_ptr<IExecutionObserver> observer) {
        observer_ = std::move(observer);
    }

    /**
     * @brief Standalone VALIDATE check, without running any action
     */
    bool canExecute(const Transition &transition, const StateSet &active) const;

    /**
     * @brief Reason VALIDATE would reject the transition, nullopt if it would pass
     */
    std::optional<std::string> explainRejection(const Transition &transition, const StateSet &active) const;

    /**
     * @brief Execute the transition against a configuration
     * @param transition Transition to run
     * @param active Current configuration (not modified)
     * @param callbacks Optional external actions, taking precedence over inline ones
     */
    TransitionResult execute(const Transition &transition, const StateSet &active,
                             const ICallbackRegistry *callbacks = nullptr) const;

    /**
     * @brief What-if configuration after the transition, without running any phase
     */
    StateSet project(const Transition &transition, const StateSet &active) const {
        return transition.project(active);
    }

    /**
     * @brief Success-policy verdict for the INCOMING phase
     * @param activatedCount Number of activated states (n)
     * @param failedCount Number of failed incoming actions (f)
     */
    static bool evaluateIncomingSuccess(SuccessPolicy policy, double threshold, size_t activatedCount,
                                        size_t failedCount);

private:
    bool runPhases(const Transition &transition, const StateSet &active, const ICallbackRegistry *callbacks,
                   TransitionResult &result, TransitionPhase &currentPhase) const;

    bool runOutgoingPhase(const Transition &transition, const ICallbackRegistry *callbacks,
                          TransitionResult &result) const;

    bool runIncomingPhase(const Transition &transition, const StateSet &activated, const ICallbackRegistry *callbacks,
                          TransitionResult &result) const;

    void runVisibilityPhase(const Transition &transition, TransitionResult &result) const;

    std::optional<std::string> findBlockingVeto(const Transition &transition, const StateSet &active) const;
    std::optional<std::string> findAtomicityViolation(const Transition &transition, const StateSet &active) const;

    void notifyObserver(const TransitionResult &result, std::chrono::duration<double> elapsed) const;

    ExecutorConfig config_;
    std::shared_ptr<const StateRegistry> registry_;
    std::shared_ptr<IExecutionObserver> observer_;
};

}  // namespace MST
