#include "Simulation.h"
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

DirectEngine::Config direct_config(const Simulation::Config& c) {
    DirectEngine::Config out;
    out.gravitational_constant = c.gravitational_constant;
    out.enable_threading = c.enable_threading;
    return out;
}

GridEngine::Config grid_config(const Simulation::Config& c) {
    GridEngine::Config out = c.grid;
    out.gravitational_constant = c.gravitational_constant;
    out.enable_threading = c.enable_threading;
    return out;
}

BarnesHutEngine::Config barnes_hut_config(const Simulation::Config& c) {
    BarnesHutEngine::Config out = c.barnes_hut;
    out.gravitational_constant = c.gravitational_constant;
    out.enable_threading = c.enable_threading;
    return out;
}

} // namespace

const char* to_string(ForceStrategy strategy) {
    switch (strategy) {
        case ForceStrategy::Direct:    return "direct";
        case ForceStrategy::Grid:      return "grid";
        case ForceStrategy::BarnesHut: return "barnes_hut";
    }
    return "unknown";
}

Simulation::Simulation(EventBus& event_bus, const Config& config)
    : config_(config), event_bus_(event_bus),
      direct_(direct_config(config)),
      grid_(grid_config(config)),
      barnes_hut_(barnes_hut_config(config)),
      collision_(event_bus, config.collision),
      theta_controller_(config.theta),
      iteration_count_(0) {

    std::cout << "Simulation initialized: G=" << config_.gravitational_constant
              << ", theta=" << theta_controller_.theta()
              << " (max " << config_.theta.theta_max << ", step " << config_.theta.step << ")"
              << ", grid tau=" << config_.grid.tau << "\n";

    #ifdef _OPENMP
        if (config_.enable_threading) {
            std::cout << "OpenMP threading enabled with " << omp_get_max_threads() << " threads\n";
        }
    #endif
}

void Simulation::advance(BodyStore& bodies, double dt) {
    const size_t before = bodies.size();

    collision_.advance(bodies, dt);
    if (config_.normalize_momentum_each_tick) {
        bodies.normalize_momentum();
    }

    const auto& stats = collision_.get_last_tick_stats();
    AdvanceEvent event{dt, before, bodies.size(), stats.merge_count, stats.collision_steps};
    event_bus_.emit(Events::ADVANCE, event);
}

std::chrono::nanoseconds Simulation::apply_forces(BodyStore& bodies, ForceStrategy strategy, double dt) {
    std::chrono::nanoseconds elapsed{0};

    switch (strategy) {
        case ForceStrategy::Direct:
            elapsed = direct_.apply(bodies, dt);
            break;
        case ForceStrategy::Grid:
            elapsed = grid_.apply(bodies, dt);
            break;
        case ForceStrategy::BarnesHut:
            elapsed = barnes_hut_.apply(bodies, dt, theta_controller_.theta());
            break;
    }

    ++iteration_count_;

    ForcePassEvent event{to_string(strategy), double(elapsed.count()) / 1000.0, bodies.size()};
    event_bus_.emit(Events::FORCE_PASS, event);

    return elapsed;
}

std::chrono::nanoseconds Simulation::step(BodyStore& bodies, ForceStrategy strategy, double dt) {
    advance(bodies, dt);
    return apply_forces(bodies, strategy, dt);
}

double Simulation::adjust_theta(ThetaDirection direction) {
    const double old_theta = theta_controller_.theta();
    const double new_theta = theta_controller_.adjust(direction);

    ThetaAdjustedEvent event{old_theta, new_theta, 0.0, 0.0};
    event_bus_.emit(Events::THETA_ADJUSTED, event);
    return new_theta;
}

ThetaDirection Simulation::update_theta(std::chrono::nanoseconds bh_elapsed, size_t bh_bodies,
                                        std::chrono::nanoseconds grid_elapsed, size_t grid_bodies) {
    const double old_theta = theta_controller_.theta();
    const ThetaDirection direction =
        theta_controller_.update(bh_elapsed, bh_bodies, grid_elapsed, grid_bodies);

    ThetaAdjustedEvent event{
        old_theta, theta_controller_.theta(),
        AdaptiveThetaController::cost_per_body_ns(bh_elapsed, bh_bodies),
        AdaptiveThetaController::cost_per_body_ns(grid_elapsed, grid_bodies)
    };
    event_bus_.emit(Events::THETA_ADJUSTED, event);
    return direction;
}
