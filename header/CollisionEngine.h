#pragma once
#include "BodyStore.h"
#include "EventSystem.h"
#include <optional>

// Continuous-time collision detection with perfectly inelastic merging. One call to
// advance() moves the store through a full tick and leaves no two bodies overlapping.
class CollisionEngine {
public:
    struct Config {
        bool settle_at_start;      // merge overlaps present before the tick, deepest first

        Config()
            : settle_at_start(false)
        {}
    };

    struct Contact {
        BodyId first;
        BodyId second;
        double time;
    };

    struct TickStats {
        size_t collision_steps = 0;    // contacts found inside the time budget
        size_t settle_merges = 0;      // merges from overlap settling
        size_t merge_count = 0;        // all merges this tick
    };

    CollisionEngine(EventBus& event_bus, const Config& config = Config{});

    void advance(BodyStore& bodies, double dt);

    // Earliest surface contact within [0, horizon], first pair in id order on ties.
    std::optional<Contact> find_earliest_collision(const BodyStore& bodies, double horizon) const;

    // Pair with the greatest positive penetration depth, if any.
    std::optional<Contact> find_deepest_overlap(const BodyStore& bodies) const;

    // Merges deepest overlaps until none is left; returns the number of merges.
    size_t settle_overlaps(BodyStore& bodies, double time_in_tick);

    // Contact time of two straight-line trajectories, if it falls within [0, horizon].
    static std::optional<double> contact_time(const Body& a, const Body& b, double horizon);

    const TickStats& get_last_tick_stats() const { return last_tick_; }
    const Config& get_config() const { return config_; }

private:
    BodyId merge_pair(BodyStore& bodies, BodyId a, BodyId b, double time_in_tick);

    Config config_;
    EventBus& event_bus_;
    TickStats last_tick_;
};
