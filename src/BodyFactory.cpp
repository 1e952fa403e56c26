#include "BodyFactory.h"
#include <cmath>
#include <iostream>
#include <random>

BodyFactory::BodyFactory(BodyStore& bodies)
    : bodies_(bodies) {
}

BodyId BodyFactory::add_body(const Vector2d& pos, const Vector2d& vel, double mass) {
    return bodies_.add_body(pos, vel, mass);
}

bool BodyFactory::overlaps_existing(const Vector2d& pos, double radius) const {
    for (const auto& [id, body] : bodies_) {
        if ((body.pos - pos).norm() < body.radius + radius) return true;
    }
    return false;
}

void BodyFactory::create_random_disc(size_t count, const Vector2d& center,
                                     double radius_x, double radius_y,
                                     double mass, double drift_speed, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * M_PI);

    for (size_t i = 0; i < count; ++i) {
        // sqrt keeps the areal density uniform
        const double r = std::sqrt(unit(gen));
        const double th = angle_dist(gen);
        const Vector2d pos = center + Vector2d(radius_x * r * std::cos(th), radius_y * r * std::sin(th));

        const double heading = angle_dist(gen);
        const Vector2d vel(drift_speed * std::cos(heading), drift_speed * std::sin(heading));

        bodies_.add_body(pos, vel, mass);
    }

    bodies_.normalize_momentum();

    std::cout << "Created random disc: " << count << " bodies, radii ("
              << radius_x << ", " << radius_y << "), total mass " << bodies_.total_mass() << "\n";
}

void BodyFactory::create_ring(size_t count, const Vector2d& center, double radius,
                              double mass, double tangential_speed) {
    for (size_t i = 0; i < count; ++i) {
        const double th = 2.0 * M_PI * double(i) / double(count);
        const Vector2d offset(std::cos(th), std::sin(th));
        const Vector2d tangent(-std::sin(th), std::cos(th));
        bodies_.add_body(center + radius * offset, tangential_speed * tangent, mass);
    }
}

void BodyFactory::create_binary(const Vector2d& center, double separation,
                                double mass_a, double mass_b, double G) {
    const double M = mass_a + mass_b;
    const double ra = separation * mass_b / M;
    const double rb = separation * mass_a / M;

    // v_i = r_i * sqrt(G M / d^3) for a circular orbit about the barycenter
    const double omega = std::sqrt(G * M / (separation * separation * separation));

    bodies_.add_body(center + Vector2d(-ra, 0.0), Vector2d(0.0, -ra * omega), mass_a);
    bodies_.add_body(center + Vector2d(rb, 0.0), Vector2d(0.0, rb * omega), mass_b);
}

void BodyFactory::add_random_bodies(size_t count, double half_extent, double mass, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<double> coord(-half_extent, half_extent);

    const double radius = Body::radius_for_mass(mass);
    const size_t max_attempts = count * 100;

    size_t placed = 0, attempts = 0;
    while (placed < count && attempts < max_attempts) {
        ++attempts;
        const Vector2d pos(coord(gen), coord(gen));
        if (overlaps_existing(pos, radius)) continue;
        bodies_.add_body(pos, Vector2d::Zero(), mass);
        ++placed;
    }

    if (placed < count) {
        std::cout << "add_random_bodies: placed " << placed << " of " << count
                  << " bodies without overlap (extent " << half_extent << ")\n";
    }
}
