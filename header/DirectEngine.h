#pragma once
#include "BodyStore.h"
#include <chrono>
#include <vector>

// Exact O(n^2) pairwise summation. Every kick is computed from a snapshot taken before
// any velocity is written, so the result does not depend on visiting order.
class DirectEngine {
public:
    struct Config {
        double gravitational_constant;
        bool enable_threading;

        Config()
            : gravitational_constant(G_DEFAULT)
            , enable_threading(true)
        {}
    };

    explicit DirectEngine(const Config& config = Config{});

    std::chrono::nanoseconds apply(BodyStore& bodies, double dt);

    // Velocity deltas without touching the store; index-aligned with snap.
    void compute_deltas(const BodySnapshot& snap, double dt, std::vector<Vector2d>& dv) const;

    const Config& get_config() const { return config_; }

private:
    Config config_;
    std::vector<Vector2d> deltas_;
};
