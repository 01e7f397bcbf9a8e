#pragma once

#include <chrono>
#include <cstddef>

namespace MST {

/**
 * @brief Expansion and wall-clock budget of a single search
 */
class SearchBudget {
public:
    SearchBudget(size_t maxExpansions, std::chrono::duration<double> maxTime)
        : maxExpansions_(maxExpansions), maxTime_(maxTime) {}

    void start() {
        startTime_ = std::chrono::steady_clock::now();
        expansions_ = 0;
    }

    void recordExpansion() {
        expansions_++;
    }

    bool canContinue() const {
        return !isExpansionExhausted() && !isTimeExhausted();
    }

    bool isExpansionExhausted() const {
        return expansions_ >= maxExpansions_;
    }

    bool isTimeExhausted() const {
        return elapsed() >= maxTime_;
    }

    std::chrono::duration<double> elapsed() const {
        return std::chrono::steady_clock::now() - startTime_;
    }

    size_t expansions() const {
        return expansions_;
    }

private:
    size_t maxExpansions_;
    std::chrono::duration<double> maxTime_;
    size_t expansions_ = 0;
    std::chrono::steady_clock::time_point startTime_ = std::chrono::steady_clock::now();
};

}  // namespace MST
