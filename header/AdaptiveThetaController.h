#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>

enum class ThetaDirection { Increase, Decrease };

// Bang-bang controller for the Barnes-Hut acceptance threshold. Theta lives in an atomic
// cell: one writer per tick, readers take it once per pass, staleness by a tick is harmless.
class AdaptiveThetaController {
public:
    struct Config {
        double initial_theta;
        double step;
        double theta_max;

        Config()
            : initial_theta(1.0)
            , step(0.05)
            , theta_max(2.0)
        {}
    };

    explicit AdaptiveThetaController(const Config& config = Config{});

    double theta() const { return theta_.load(std::memory_order_relaxed); }
    void set_theta(double theta);

    // Moves theta one step and clamps into [0, theta_max]; returns the new value.
    double adjust(ThetaDirection direction);

    // Cheaper-or-equal Barnes-Hut per body buys accuracy (decrease), dearer buys speed.
    ThetaDirection update(std::chrono::nanoseconds bh_elapsed, size_t bh_bodies,
                          std::chrono::nanoseconds grid_elapsed, size_t grid_bodies);

    static double cost_per_body_ns(std::chrono::nanoseconds elapsed, size_t bodies);

    const Config& get_config() const { return config_; }

private:
    double clamp(double theta) const;

    Config config_;
    std::atomic<double> theta_;
};
