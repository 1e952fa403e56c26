#include "AdaptiveThetaController.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

AdaptiveThetaController::AdaptiveThetaController(const Config& config)
    : config_(config), theta_(0.0) {
    if (!(config_.theta_max >= 0.0) || !(config_.step >= 0.0)) {
        throw std::invalid_argument("AdaptiveThetaController: theta_max and step must be non-negative");
    }
    theta_.store(clamp(config_.initial_theta), std::memory_order_relaxed);
}

double AdaptiveThetaController::clamp(double theta) const {
    if (std::isnan(theta)) return 0.0;
    return std::clamp(theta, 0.0, config_.theta_max);
}

void AdaptiveThetaController::set_theta(double theta) {
    theta_.store(clamp(theta), std::memory_order_relaxed);
}

double AdaptiveThetaController::adjust(ThetaDirection direction) {
    const double current = theta();
    const double next = clamp(direction == ThetaDirection::Increase ? current + config_.step
                                                                    : current - config_.step);
    theta_.store(next, std::memory_order_relaxed);
    return next;
}

double AdaptiveThetaController::cost_per_body_ns(std::chrono::nanoseconds elapsed, size_t bodies) {
    return double(elapsed.count()) / double(std::max<size_t>(1, bodies));
}

ThetaDirection AdaptiveThetaController::update(std::chrono::nanoseconds bh_elapsed, size_t bh_bodies,
                                               std::chrono::nanoseconds grid_elapsed, size_t grid_bodies) {
    const ThetaDirection direction =
        cost_per_body_ns(bh_elapsed, bh_bodies) <= cost_per_body_ns(grid_elapsed, grid_bodies)
            ? ThetaDirection::Decrease
            : ThetaDirection::Increase;
    adjust(direction);
    return direction;
}
