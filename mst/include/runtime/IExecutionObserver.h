#pragma once

#include <chrono>
#include <string>

namespace MST {

/**
 * @brief Receives the outcome of every TransitionExecutor run
 *
 * Implementations shared between executors must synchronize internally.
 */
class IExecutionObserver {
public:
    virtual ~IExecutionObserver() = default;

    virtual void recordExecution(const std::string &transitionId, bool success,
                                 std::chrono::duration<double> elapsed) = 0;
};

}  // namespace MST
