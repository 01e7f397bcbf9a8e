#pragma once

#include "runtime/ICostProvider.h"
#include "runtime/IExecutionObserver.h"
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace MST {

/**
 * @brief Cost penalty applied to unreliable transitions
 *
 * The multiplier grows linearly with the failure rate, from 1.0 at no failures
 * to costMultiplierOnFailure when every attempt failed, and is then clamped to
 * [minCostMultiplier, maxCostMultiplier].
 */
struct ReliabilityConfig {
    double costMultiplierOnFailure = 2.0;
    double minCostMultiplier = 1.0;
    double maxCostMultiplier = 10.0;
};

/**
 * @brief Execution statistics of a single transition
 */
struct TransitionStats {
    std::string transitionId;
    uint64_t successCount = 0;
    uint64_t failureCount = 0;
    std::chrono::duration<double> totalTime{0.0};
    std::optional<std::chrono::system_clock::time_point> lastSuccessTime;
    std::optional<std::chrono::system_clock::time_point> lastFailureTime;

    uint64_t getTotalAttempts() const {
        return successCount + failureCount;
    }

    // 1.0 while no attempt has been recorded
    double getSuccessRate() const;

    double getFailureRate() const {
        return 1.0 - getSuccessRate();
    }

    std::chrono::duration<double> getAverageTime() const;

    Json::Value toJson() const;
};

/**
 * @brief Thread-safe per-transition reliability bookkeeping
 *
 * Acts as the execution observer of a TransitionExecutor and as the cost
 * provider of a MultiTargetPathFinder, so that failing transitions become
 * more expensive in subsequent searches.
 */
class ReliabilityTracker : public ICostProvider, public IExecutionObserver {
public:
    /**
     * @throws std::invalid_argument on non-positive, non-finite or inverted multipliers
     */
    explicit ReliabilityTracker(const ReliabilityConfig &config = ReliabilityConfig());

    const ReliabilityConfig &getConfig() const {
        return config_;
    }

    void recordSuccess(const std::string &transitionId,
                       std::chrono::duration<double> elapsed = std::chrono::duration<double>(0.0));
    void recordFailure(const std::string &transitionId,
                       std::chrono::duration<double> elapsed = std::chrono::duration<double>(0.0));

    // IExecutionObserver
    void recordExecution(const std::string &transitionId, bool success,
                         std::chrono::duration<double> elapsed) override;

    // ICostProvider: unknown transitions keep their base cost
    double getDynamicCost(const std::string &transitionId, double baseCost) const override;

    std::optional<TransitionStats> getStats(const std::string &transitionId) const;
    std::map<std::string, TransitionStats> getAllStats() const;

    void resetStats();
    void resetStats(const std::string &transitionId);

    /**
     * @brief Aggregate counts, overall success rate and per-transition stats
     */
    Json::Value getSummary() const;

    /**
     * @brief Transitions with at least one attempt, lowest success rate first
     */
    std::vector<TransitionStats> getLeastReliable(size_t limit = 5) const;

    /**
     * @brief Transitions with at least one attempt, highest success rate first
     */
    std::vector<TransitionStats> getMostReliable(size_t limit = 5) const;

private:
    std::vector<TransitionStats> rankByReliability(size_t limit, bool ascending) const;

    ReliabilityConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, TransitionStats> stats_;
};

}  // namespace MST
