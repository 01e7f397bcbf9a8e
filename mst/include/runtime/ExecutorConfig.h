#pragma once

#include "common/types.h"

namespace MST {

/**
 * @brief TransitionExecutor settings
 */
struct ExecutorConfig {
    SuccessPolicy successPolicy = SuccessPolicy::STRICT;

    // THRESHOLD policy: minimum ratio of successful incoming actions, in [0, 1]
    double successThreshold = 0.8;

    // Reject transitions whose projected configuration splits a touched group
    bool validateGroupAtomicity = true;
};

}  // namespace MST
