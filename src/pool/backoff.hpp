#pragma once

#include <algorithm>
#include <core/types.hpp>

// Exponential restart delay: initial, 2x, 4x ... capped at max.
struct RestartBackoff {
    int initial_ms = 200;
    int max_ms = 5000;
    int current_ms = 200;

    RestartBackoff() = default;
    explicit RestartBackoff(const RestartPolicy& policy)
        : initial_ms(policy.initial_backoff_ms),
          max_ms(policy.max_backoff_ms),
          current_ms(policy.initial_backoff_ms) {}

    void reset() { current_ms = initial_ms; }

    int next() {
        int v = std::min(current_ms, max_ms);
        current_ms = current_ms >= max_ms / 2 ? max_ms : current_ms * 2;
        return v;
    }
};
