#include "pathfinding/MultiTargetPathFinder.h"
#include "common/Logger.h"
#include "pathfinding/SearchBudget.h"
#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace MST {

namespace {

using ConfigBits = std::vector<uint64_t>;

constexpr size_t NO_INDEX = std::numeric_limits<size_t>::max();

bool hasAny(const ConfigBits &bits) {
    return std::any_of(bits.begin(), bits.end(), [](uint64_t word) { return word != 0; });
}

/**
 * @brief Bit assignment of every state seen by one search
 */
class StateIndex {
public:
    void add(const StateSet &states) {
        for (const auto &[stateId, state] : states) {
            if (bitOf_.emplace(stateId, statesByBit_.size()).second) {
                statesByBit_.push_back(state);
            }
        }
    }

    size_t wordCount() const {
        return (statesByBit_.size() + 63) / 64;
    }

    size_t bitOf(const std::string &stateId) const {
        return bitOf_.at(stateId);
    }

    ConfigBits encode(const StateSet &states) const {
        ConfigBits bits(wordCount(), 0);
        for (const auto &[stateId, state] : states) {
            size_t bit = bitOf(stateId);
            bits[bit / 64] |= uint64_t{1} << (bit % 64);
        }
        return bits;
    }

    StateSet decode(const ConfigBits &bits) const {
        StateSet states;
        for (size_t bit = 0; bit < statesByBit_.size(); ++bit) {
            if (bits[bit / 64] & (uint64_t{1} << (bit % 64))) {
                states.insert(statesByBit_[bit]);
            }
        }
        return states;
    }

private:
    std::map<std::string, size_t> bitOf_;
    std::vector<ConstStatePtr> statesByBit_;
};

struct CompiledTransition {
    TransitionPtr transition;
    ConfigBits fromMask;
    ConfigBits activateMask;
    ConfigBits keepMask;  // Complement of the exit set
    double cost = 0.0;
    size_t targetsActivated = 0;

    ConfigBits apply(const ConfigBits &active) const {
        ConfigBits next(active.size());
        for (size_t i = 0; i < active.size(); ++i) {
            next[i] = (active[i] & keepMask[i]) | activateMask[i];
        }
        return next;
    }
};

struct SearchKey {
    ConfigBits configuration;
    ConfigBits reached;  // Bit i set once target i was active in some visited configuration

    bool operator==(const SearchKey &other) const {
        return reached == other.reached && configuration == other.configuration;
    }
};

struct SearchKeyHash {
    size_t operator()(const SearchKey &key) const {
        size_t seed = 0;
        auto combine = [&seed](uint64_t word) {
            seed ^= std::hash<uint64_t>()(word) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (uint64_t word : key.reached) {
            combine(word);
        }
        for (uint64_t word : key.configuration) {
            combine(word);
        }
        return seed;
    }
};

// Search tree node; the tree lives in an arena and parents are indices into it
struct PathNode {
    SearchKey key;
    size_t parent = NO_INDEX;
    size_t transitionIndex = NO_INDEX;
    double cost = 0.0;
    size_t depth = 0;
};

struct QueueEntry {
    double priority;
    double cost;
    size_t sequence;
    size_t nodeIndex;

    // Inverted for std::priority_queue: lowest priority first, then FIFO
    bool operator<(const QueueEntry &other) const {
        if (priority != other.priority) {
            return priority > other.priority;
        }
        return sequence > other.sequence;
    }
};

enum class SearchOutcome { GOAL, EXHAUSTED_SPACE, EXHAUSTED_BUDGET };

class SearchRun {
public:
    SearchRun(const StateIndex &index, const std::vector<CompiledTransition> &transitions,
              const std::vector<size_t> &targetBits, SearchBudget &budget)
        : index_(index), transitions_(transitions), targetBits_(targetBits), budget_(budget) {
        fullMask_.assign((targetBits_.size() + 63) / 64, 0);
        for (size_t i = 0; i < targetBits_.size(); ++i) {
            fullMask_[i / 64] |= uint64_t{1} << (i % 64);
        }

        minEdgeCost_ = std::numeric_limits<double>::infinity();
        byFromBit_.resize(index_.wordCount() * 64);
        for (size_t t = 0; t < transitions_.size(); ++t) {
            const CompiledTransition &compiled = transitions_[t];
            minEdgeCost_ = std::min(minEdgeCost_, compiled.cost);
            maxTargetsPerTransition_ = std::max(maxTargetsPerTransition_, compiled.targetsActivated);

            if (!hasAny(compiled.fromMask)) {
                wildcards_.push_back(t);
                continue;
            }
            forEachBit(compiled.fromMask, [&](size_t bit) { byFromBit_[bit].push_back(t); });
        }
    }

    size_t addRoot(const ConfigBits &start) {
        PathNode root;
        root.key.configuration = start;
        root.key.reached = reachedIn(start, ConfigBits(fullMask_.size(), 0));
        nodes_.push_back(std::move(root));
        return 0;
    }

    SearchOutcome breadthFirst(size_t &goalIndex) {
        std::deque<size_t> frontier{0};
        std::unordered_set<SearchKey, SearchKeyHash> seen{nodes_[0].key};

        while (!frontier.empty()) {
            size_t current = frontier.front();
            frontier.pop_front();

            if (isGoal(current)) {
                goalIndex = current;
                return SearchOutcome::GOAL;
            }
            if (!budget_.canContinue()) {
                return SearchOutcome::EXHAUSTED_BUDGET;
            }
            budget_.recordExpansion();

            for (size_t t : enabledTransitions(nodes_[current].key.configuration)) {
                PathNode child = makeChild(current, t);
                if (!seen.insert(child.key).second) {
                    continue;
                }
                nodes_.push_back(std::move(child));
                frontier.push_back(nodes_.size() - 1);
            }
        }
        return SearchOutcome::EXHAUSTED_SPACE;
    }

    SearchOutcome bestFirst(bool useHeuristic, size_t &goalIndex) {
        std::priority_queue<QueueEntry> frontier;
        std::unordered_map<SearchKey, double, SearchKeyHash> bestCost{{nodes_[0].key, 0.0}};
        std::unordered_set<SearchKey, SearchKeyHash> closed;
        size_t sequence = 0;

        frontier.push({useHeuristic ? heuristic(nodes_[0].key.reached) : 0.0, 0.0, sequence++, 0});

        while (!frontier.empty()) {
            QueueEntry entry = frontier.top();
            frontier.pop();

            const SearchKey &key = nodes_[entry.nodeIndex].key;
            if (closed.count(key) || entry.cost > bestCost[key]) {
                continue;  // Stale entry
            }
            closed.insert(key);

            if (isGoal(entry.nodeIndex)) {
                goalIndex = entry.nodeIndex;
                return SearchOutcome::GOAL;
            }
            if (!budget_.canContinue()) {
                return SearchOutcome::EXHAUSTED_BUDGET;
            }
            budget_.recordExpansion();

            size_t current = entry.nodeIndex;
            for (size_t t : enabledTransitions(nodes_[current].key.configuration)) {
                PathNode child = makeChild(current, t);
                if (closed.count(child.key)) {
                    continue;
                }
                auto known = bestCost.find(child.key);
                if (known != bestCost.end() && known->second <= child.cost) {
                    continue;
                }
                bestCost[child.key] = child.cost;

                double priority = child.cost + (useHeuristic ? heuristic(child.key.reached) : 0.0);
                double cost = child.cost;
                nodes_.push_back(std::move(child));
                frontier.push({priority, cost, sequence++, nodes_.size() - 1});
            }
        }
        return SearchOutcome::EXHAUSTED_SPACE;
    }

    Path reconstruct(size_t goalIndex, const StateSet &targets) const {
        std::vector<size_t> chain;
        for (size_t i = goalIndex; i != NO_INDEX; i = nodes_[i].parent) {
            chain.push_back(i);
        }
        std::reverse(chain.begin(), chain.end());

        Path path;
        path.targets = targets;
        path.totalCost = nodes_[goalIndex].cost;
        for (size_t nodeIndex : chain) {
            const PathNode &node = nodes_[nodeIndex];
            path.statesSequence.push_back(index_.decode(node.key.configuration));
            if (node.transitionIndex != NO_INDEX) {
                path.transitionsSequence.push_back(transitions_[node.transitionIndex].transition);
            }
        }
        return path;
    }

    size_t generatedNodes() const {
        return nodes_.size();
    }

private:
    template <typename Visitor> static void forEachBit(const ConfigBits &bits, Visitor visit) {
        for (size_t word = 0; word < bits.size(); ++word) {
            for (uint64_t remaining = bits[word]; remaining != 0; remaining &= remaining - 1) {
                visit(word * 64 + static_cast<size_t>(std::countr_zero(remaining)));
            }
        }
    }

    // Wildcards plus transitions listing an active source, in declaration order
    std::vector<size_t> enabledTransitions(const ConfigBits &configuration) const {
        std::vector<size_t> enabled = wildcards_;
        forEachBit(configuration, [&](size_t bit) {
            enabled.insert(enabled.end(), byFromBit_[bit].begin(), byFromBit_[bit].end());
        });
        std::sort(enabled.begin(), enabled.end());
        enabled.erase(std::unique(enabled.begin(), enabled.end()), enabled.end());
        return enabled;
    }

    ConfigBits reachedIn(const ConfigBits &configuration, ConfigBits reached) const {
        for (size_t i = 0; i < targetBits_.size(); ++i) {
            size_t bit = targetBits_[i];
            if (configuration[bit / 64] & (uint64_t{1} << (bit % 64))) {
                reached[i / 64] |= uint64_t{1} << (i % 64);
            }
        }
        return reached;
    }

    bool isGoal(size_t nodeIndex) const {
        return nodes_[nodeIndex].key.reached == fullMask_;
    }

    PathNode makeChild(size_t parentIndex, size_t transitionIndex) const {
        const PathNode &parent = nodes_[parentIndex];
        const CompiledTransition &compiled = transitions_[transitionIndex];

        PathNode child;
        child.key.configuration = compiled.apply(parent.key.configuration);
        child.key.reached = reachedIn(child.key.configuration, parent.key.reached);
        child.parent = parentIndex;
        child.transitionIndex = transitionIndex;
        child.cost = parent.cost + compiled.cost;
        child.depth = parent.depth + 1;
        return child;
    }

    // Each step costs at least minEdgeCost_ and reaches at most maxTargetsPerTransition_ targets
    double heuristic(const ConfigBits &reached) const {
        size_t reachedCount = 0;
        for (uint64_t word : reached) {
            reachedCount += static_cast<size_t>(std::popcount(word));
        }
        size_t remaining = targetBits_.size() - reachedCount;
        if (remaining == 0 || maxTargetsPerTransition_ == 0) {
            return 0.0;
        }
        size_t steps = (remaining + maxTargetsPerTransition_ - 1) / maxTargetsPerTransition_;
        return minEdgeCost_ * static_cast<double>(steps);
    }

    const StateIndex &index_;
    const std::vector<CompiledTransition> &transitions_;
    const std::vector<size_t> &targetBits_;
    SearchBudget &budget_;

    std::vector<PathNode> nodes_;
    std::vector<std::vector<size_t>> byFromBit_;
    std::vector<size_t> wildcards_;
    ConfigBits fullMask_;
    double minEdgeCost_ = 0.0;
    size_t maxTargetsPerTransition_ = 0;
};

}  // namespace

MultiTargetPathFinder::MultiTargetPathFinder(const std::vector<TransitionPtr> &transitions,
                                             const PathFinderConfig &config)
    : config_(config) {
    if (config_.maxExpandedNodes == 0) {
        throw std::invalid_argument("Path finder node budget must be positive");
    }
    if (!(config_.maxSearchTime.count() > 0.0)) {
        throw std::invalid_argument("Path finder time budget must be positive");
    }
    for (const auto &transition : transitions) {
        addTransition(transition);
    }
    LOG_DEBUG("MultiTargetPathFinder: created with {} transitions, default strategy {}", transitions_.size(),
              toString(config_.strategy));
}

void MultiTargetPathFinder::addTransition(const TransitionPtr &transition) {
    if (!transition) {
        throw std::invalid_argument("Path finder transition must not be null");
    }
    transitions_.push_back(transition);
}

std::optional<Path> MultiTargetPathFinder::findPathToAll(const StateSet &current, const StateSet &targets) const {
    return findPathToAll(current, targets, config_.strategy);
}

std::optional<Path> MultiTargetPathFinder::findPathToAll(const StateSet &current, const StateSet &targets,
                                                         SearchStrategy strategy) const {
    PathSearchResult result = search(current, targets, strategy);
    if (result.status == SearchStatus::BUDGET_EXHAUSTED || result.status == SearchStatus::INVALID_INPUT) {
        LOG_WARN("MultiTargetPathFinder: no path returned ({}): {}", toString(result.status), result.errorMessage);
    }
    return result.path;
}

PathSearchResult MultiTargetPathFinder::search(const StateSet &current, const StateSet &targets) const {
    return search(current, targets, config_.strategy);
}

PathSearchResult MultiTargetPathFinder::search(const StateSet &current, const StateSet &targets,
                                               SearchStrategy strategy) const {
    SearchBudget budget(config_.maxExpandedNodes, config_.maxSearchTime);
    budget.start();

    SearchStatistics statistics;
    statistics.strategy = strategy;

    if (targets.isSubsetOf(current)) {
        Path path;
        path.statesSequence.push_back(current);
        path.targets = targets;
        statistics.generatedNodes = 1;
        statistics.elapsed = budget.elapsed();
        LOG_DEBUG("MultiTargetPathFinder: all targets {} already active", targets.toString());
        return PathSearchResult::found(std::move(path), statistics);
    }

    StateIndex index;
    index.add(current);
    index.add(targets);
    for (const auto &transition : transitions_) {
        index.add(transition->getFromStates());
        index.add(transition->getStatesToActivate());
        index.add(transition->getStatesToExit());
    }

    std::vector<size_t> targetBits;
    for (const auto &[stateId, state] : targets) {
        targetBits.push_back(index.bitOf(stateId));
    }

    std::vector<CompiledTransition> compiled;
    compiled.reserve(transitions_.size());
    for (const auto &transition : transitions_) {
        double cost = transition->getCost();
        if (costProvider_) {
            try {
                cost = costProvider_->getDynamicCost(transition->getId(), transition->getCost());
            } catch (const std::exception &e) {
                statistics.elapsed = budget.elapsed();
                return PathSearchResult::invalidInput(
                    statistics, "Cost provider failed for '" + transition->getId() + "': " + e.what());
            }
        }
        if (!std::isfinite(cost) || cost < 0.0) {
            statistics.elapsed = budget.elapsed();
            return PathSearchResult::invalidInput(statistics, "Transition '" + transition->getId() +
                                                                  "' has invalid effective cost " +
                                                                  std::to_string(cost));
        }

        CompiledTransition entry;
        entry.transition = transition;
        entry.fromMask = index.encode(transition->getFromStates());
        entry.activateMask = index.encode(transition->getStatesToActivate());
        entry.keepMask = index.encode(transition->getStatesToExit());
        for (auto &word : entry.keepMask) {
            word = ~word;
        }
        entry.cost = cost;
        entry.targetsActivated = transition->getStatesToActivate().intersection(targets).size();
        compiled.push_back(std::move(entry));
    }

    SearchRun run(index, compiled, targetBits, budget);
    run.addRoot(index.encode(current));

    size_t goalIndex = NO_INDEX;
    SearchOutcome outcome = strategy == SearchStrategy::BFS
                                ? run.breadthFirst(goalIndex)
                                : run.bestFirst(strategy == SearchStrategy::A_STAR, goalIndex);

    statistics.expandedNodes = budget.expansions();
    statistics.generatedNodes = run.generatedNodes();
    statistics.elapsed = budget.elapsed();

    switch (outcome) {
    case SearchOutcome::GOAL: {
        Path path = run.reconstruct(goalIndex, targets);
        LOG_INFO("MultiTargetPathFinder: {} found path [{}] cost {} to {} ({} expanded)", toString(strategy),
                 path.toString(), path.totalCost, targets.toString(), statistics.expandedNodes);
        return PathSearchResult::found(std::move(path), statistics);
    }
    case SearchOutcome::EXHAUSTED_BUDGET: {
        std::string reason = budget.isExpansionExhausted()
                                 ? "Node budget of " + std::to_string(config_.maxExpandedNodes) + " exhausted"
                                 : "Time budget exhausted";
        LOG_WARN("MultiTargetPathFinder: {} stopped: {}", toString(strategy), reason);
        return PathSearchResult::budgetExhausted(statistics, reason);
    }
    case SearchOutcome::EXHAUSTED_SPACE:
        break;
    }

    LOG_DEBUG("MultiTargetPathFinder: {} found no path to {} ({} expanded)", toString(strategy), targets.toString(),
              statistics.expandedNodes);
    return PathSearchResult::noPath(statistics);
}

}  // namespace MST
