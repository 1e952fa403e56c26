#pragma once

#include "BodyStore.h"

#include <cstdint>

// Populates a body store with initial conditions.
class BodyFactory {
public:
    explicit BodyFactory(BodyStore& bodies);

    // Uniform-density elliptical disc; each body drifts at `drift_speed` in a random
    // direction, then net momentum is removed.
    void create_random_disc(size_t count, const Vector2d& center,
                            double radius_x, double radius_y,
                            double mass = INITIAL_MASS,
                            double drift_speed = INITIAL_DRIFT_SPEED,
                            uint32_t seed = 42);

    // Bodies evenly spaced on a circle, moving tangentially (counter-clockwise).
    void create_ring(size_t count, const Vector2d& center, double radius,
                     double mass, double tangential_speed);

    // Two bodies on a circular mutual orbit about their center of mass.
    void create_binary(const Vector2d& center, double separation,
                       double mass_a, double mass_b, double G = G_DEFAULT);

    // Randomly placed bodies inside a square, rejecting positions that would overlap.
    void add_random_bodies(size_t count, double half_extent, double mass, uint32_t seed = 7);

    BodyId add_body(const Vector2d& pos, const Vector2d& vel, double mass);

private:
    bool overlaps_existing(const Vector2d& pos, double radius) const;

    BodyStore& bodies_;
};
