#include "runtime/ReliabilityTracker.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace MST {

namespace {

Json::Value timePointToJson(const std::optional<std::chrono::system_clock::time_point> &timePoint) {
    if (!timePoint) {
        return Json::Value(Json::nullValue);
    }
    std::chrono::duration<double> sinceEpoch = timePoint->time_since_epoch();
    return sinceEpoch.count();
}

}  // namespace

double TransitionStats::getSuccessRate() const {
    uint64_t attempts = getTotalAttempts();
    if (attempts == 0) {
        return 1.0;
    }
    return static_cast<double>(successCount) / static_cast<double>(attempts);
}

std::chrono::duration<double> TransitionStats::getAverageTime() const {
    uint64_t attempts = getTotalAttempts();
    if (attempts == 0) {
        return std::chrono::duration<double>(0.0);
    }
    return totalTime / static_cast<double>(attempts);
}

Json::Value TransitionStats::toJson() const {
    Json::Value json(Json::objectValue);
    json["transition_id"] = transitionId;
    json["success_count"] = static_cast<Json::UInt64>(successCount);
    json["failure_count"] = static_cast<Json::UInt64>(failureCount);
    json["total_attempts"] = static_cast<Json::UInt64>(getTotalAttempts());
    json["success_rate"] = getSuccessRate();
    json["failure_rate"] = getFailureRate();
    json["total_time"] = totalTime.count();
    json["average_time"] = getAverageTime().count();
    json["last_success_time"] = timePointToJson(lastSuccessTime);
    json["last_failure_time"] = timePointToJson(lastFailureTime);
    return json;
}

ReliabilityTracker::ReliabilityTracker(const ReliabilityConfig &config) : config_(config) {
    auto isPositive = [](double value) { return std::isfinite(value) && value > 0.0; };
    if (!isPositive(config_.costMultiplierOnFailure) || !isPositive(config_.minCostMultiplier) ||
        !isPositive(config_.maxCostMultiplier)) {
        throw std::invalid_argument("Reliability cost multipliers must be positive and finite");
    }
    if (config_.minCostMultiplier > config_.maxCostMultiplier) {
        throw std::invalid_argument("Minimum cost multiplier exceeds maximum cost multiplier");
    }
}

void ReliabilityTracker::recordSuccess(const std::string &transitionId, std::chrono::duration<double> elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &stats = stats_[transitionId];
    stats.transitionId = transitionId;
    stats.successCount++;
    stats.totalTime += elapsed;
    stats.lastSuccessTime = std::chrono::system_clock::now();
    LOG_DEBUG("ReliabilityTracker: '{}' succeeded, success rate {:.2f}", transitionId, stats.getSuccessRate());
}

void ReliabilityTracker::recordFailure(const std::string &transitionId, std::chrono::duration<double> elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &stats = stats_[transitionId];
    stats.transitionId = transitionId;
    stats.failureCount++;
    stats.totalTime += elapsed;
    stats.lastFailureTime = std::chrono::system_clock::now();
    LOG_DEBUG("ReliabilityTracker: '{}' failed, success rate {:.2f}", transitionId, stats.getSuccessRate());
}

void ReliabilityTracker::recordExecution(const std::string &transitionId, bool success,
                                         std::chrono::duration<double> elapsed) {
    if (success) {
        recordSuccess(transitionId, elapsed);
    } else {
        recordFailure(transitionId, elapsed);
    }
}

double ReliabilityTracker::getDynamicCost(const std::string &transitionId, double baseCost) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(transitionId);
    if (it == stats_.end() || it->second.getTotalAttempts() == 0) {
        return baseCost;
    }

    double multiplier = 1.0 + it->second.getFailureRate() * (config_.costMultiplierOnFailure - 1.0);
    multiplier = std::clamp(multiplier, config_.minCostMultiplier, config_.maxCostMultiplier);
    return baseCost * multiplier;
}

std::optional<TransitionStats> ReliabilityTracker::getStats(const std::string &transitionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(transitionId);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, TransitionStats> ReliabilityTracker::getAllStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ReliabilityTracker::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.clear();
    LOG_INFO("ReliabilityTracker: reset all transition statistics");
}

void ReliabilityTracker::resetStats(const std::string &transitionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stats_.erase(transitionId) > 0) {
        LOG_INFO("ReliabilityTracker: reset statistics for '{}'", transitionId);
    }
}

Json::Value ReliabilityTracker::getSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t totalAttempts = 0;
    uint64_t totalSuccesses = 0;
    uint64_t totalFailures = 0;
    Json::Value transitions(Json::objectValue);

    for (const auto &[transitionId, stats] : stats_) {
        totalAttempts += stats.getTotalAttempts();
        totalSuccesses += stats.successCount;
        totalFailures += stats.failureCount;
        transitions[transitionId] = stats.toJson();
    }

    Json::Value summary(Json::objectValue);
    summary["total_transitions"] = static_cast<Json::UInt64>(stats_.size());
    summary["total_attempts"] = static_cast<Json::UInt64>(totalAttempts);
    summary["total_successes"] = static_cast<Json::UInt64>(totalSuccesses);
    summary["total_failures"] = static_cast<Json::UInt64>(totalFailures);
    summary["overall_success_rate"] =
        totalAttempts > 0 ? static_cast<double>(totalSuccesses) / static_cast<double>(totalAttempts) : 0.0;
    summary["transitions"] = transitions;
    return summary;
}

std::vector<TransitionStats> ReliabilityTracker::getLeastReliable(size_t limit) const {
    return rankByReliability(limit, true);
}

std::vector<TransitionStats> ReliabilityTracker::getMostReliable(size_t limit) const {
    return rankByReliability(limit, false);
}

std::vector<TransitionStats> ReliabilityTracker::rankByReliability(size_t limit, bool ascending) const {
    std::vector<TransitionStats> ranked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[transitionId, stats] : stats_) {
            if (stats.getTotalAttempts() > 0) {
                ranked.push_back(stats);
            }
        }
    }

    // Stable sort keeps id order among equal rates
    std::stable_sort(ranked.begin(), ranked.end(), [ascending](const TransitionStats &a, const TransitionStats &b) {
        return ascending ? a.getSuccessRate() < b.getSuccessRate() : a.getSuccessRate() > b.getSuccessRate();
    });

    if (ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

}  // namespace MST
