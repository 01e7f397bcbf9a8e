#pragma once

#include "model/StateSet.h"
#include "model/Transition.h"
#include "pathfinding/PathFinderConfig.h"
#include "pathfinding/PathTypes.h"
#include "runtime/ICostProvider.h"
#include <memory>
#include <optional>
#include <vector>

namespace MST {

/**
 * @brief Minimum-cost transition sequence reaching a set of target states
 *
 * Searches the joint space (active configuration, targets reached so far).
 * A target counts as reached once it appears in any visited configuration,
 * so later transitions may deactivate it again.
 *
 * Successors use the same set algebra as Transition::project(); no executor
 * phase and no blocking veto are applied. Transitions are shared read-only,
 * so one finder may serve concurrent searches as long as the cost provider is
 * thread-safe and no transition is added meanwhile.
 */
class MultiTargetPathFinder {
public:
    /**
     * @throws std::invalid_argument on a null transition or a zero budget
     */
    explicit MultiTargetPathFinder(const std::vector<TransitionPtr> &transitions,
                                   const PathFinderConfig &config = PathFinderConfig());

    void addTransition(const TransitionPtr &transition);

    const std::vector<TransitionPtr> &getTransitions() const {
        return transitions_;
    }

    const PathFinderConfig &getConfig() const {
        return config_;
    }

    /**
     * @brief Replace base transition costs with provider costs (nullptr restores base costs)
     */
    void setCostProvider(std::shared_ptr<const ICostProvider> costProvider) {
        costProvider_ = std::move(costProvider);
    }

    /**
     * @brief Path covering every target, nullopt when none was found
     *
     * Budget exhaustion and invalid input are logged and also yield nullopt;
     * use search() to tell them apart.
     */
    std::optional<Path> findPathToAll(const StateSet &current, const StateSet &targets) const;
    std::optional<Path> findPathToAll(const StateSet &current, const StateSet &targets,
                                      SearchStrategy strategy) const;

    PathSearchResult search(const StateSet &current, const StateSet &targets) const;
    PathSearchResult search(const StateSet &current, const StateSet &targets, SearchStrategy strategy) const;

private:
    std::vector<TransitionPtr> transitions_;
    PathFinderConfig config_;
    std::shared_ptr<const ICostProvider> costProvider_;
};

}  // namespace MST
