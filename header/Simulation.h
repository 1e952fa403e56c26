#pragma once
#include "AdaptiveThetaController.h"
#include "BarnesHutEngine.h"
#include "BodyStore.h"
#include "CollisionEngine.h"
#include "DirectEngine.h"
#include "EventSystem.h"
#include "GridEngine.h"
#include <chrono>

enum class ForceStrategy { Direct, Grid, BarnesHut };

const char* to_string(ForceStrategy strategy);

// Entry point for the frame loop. Body stores are owned by the caller, so one Simulation
// can drive independent copies side by side; theta is the only state they share.
class Simulation {
public:
    struct Config {
        double gravitational_constant;
        bool enable_threading;
        bool normalize_momentum_each_tick;   // counter drift from repeated merges
        GridEngine::Config grid;
        BarnesHutEngine::Config barnes_hut;
        CollisionEngine::Config collision;
        AdaptiveThetaController::Config theta;

        Config()
            : gravitational_constant(G_DEFAULT)
            , enable_threading(true)
            , normalize_momentum_each_tick(false)
        {}
    };

    Simulation(EventBus& event_bus, const Config& config = Config{});

    // Collision/merge pass over one tick
    void advance(BodyStore& bodies, double dt);

    // One force pass; returns its wall-clock cost
    std::chrono::nanoseconds apply_forces(BodyStore& bodies, ForceStrategy strategy, double dt);

    // advance() followed by apply_forces()
    std::chrono::nanoseconds step(BodyStore& bodies, ForceStrategy strategy, double dt);

    // Theta control
    double adjust_theta(ThetaDirection direction);
    double get_theta() const { return theta_controller_.theta(); }
    ThetaDirection update_theta(std::chrono::nanoseconds bh_elapsed, size_t bh_bodies,
                                std::chrono::nanoseconds grid_elapsed, size_t grid_bodies);

    void normalize_momentum(BodyStore& bodies) const { bodies.normalize_momentum(); }

    const Config& get_config() const { return config_; }
    const BarnesHutEngine::Stats& get_barnes_hut_stats() const { return barnes_hut_.get_stats(); }
    const CollisionEngine::TickStats& get_collision_stats() const { return collision_.get_last_tick_stats(); }
    size_t get_iteration_count() const { return iteration_count_; }

private:
    Config config_;
    EventBus& event_bus_;

    DirectEngine direct_;
    GridEngine grid_;
    BarnesHutEngine barnes_hut_;
    CollisionEngine collision_;
    AdaptiveThetaController theta_controller_;

    size_t iteration_count_;
};
