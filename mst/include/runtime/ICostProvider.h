#pragma once

#include <string>

namespace MST {

/**
 * @brief Replaces a transition's base cost during path search
 *
 * Implementations shared between concurrent searches must be thread-safe.
 * Returned costs must be non-negative.
 */
class ICostProvider {
public:
    virtual ~ICostProvider() = default;

    virtual double getDynamicCost(const std::string &transitionId, double baseCost) const = 0;
};

}  // namespace MST
