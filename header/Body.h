#pragma once
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <cstdint>

using Vector2d = Eigen::Vector2d;

// Code units: positions and radii share one length unit, mass unit is a unit-mass body
// (radius 1). G chosen so a 1200-body disc of unit masses stays bound over screen-sized spans.
static constexpr double G_DEFAULT = 0.05;
static constexpr double INITIAL_MASS = 1.0;
static constexpr double INITIAL_DRIFT_SPEED = 0.05;
static constexpr size_t DEFAULT_BODY_COUNT = 1200;

using BodyId = uint64_t;

struct Body {
    Vector2d pos;
    Vector2d vel;
    double mass;
    double radius;

    Body() : pos(Vector2d::Zero()), vel(Vector2d::Zero()), mass(0.0), radius(0.0) {}
    Body(const Vector2d& p, const Vector2d& v, double m)
        : pos(p), vel(v), mass(m), radius(radius_for_mass(m)) {}

    static double radius_for_mass(double m) { return std::cbrt(m); }

    Vector2d momentum() const { return mass * vel; }

    // Perfectly inelastic: mass and momentum are conserved, kinetic energy is not.
    static Body merge(const Body& a, const Body& b) {
        const double m = a.mass + b.mass;
        return Body((a.mass * a.pos + b.mass * b.pos) / m,
                    (a.mass * a.vel + b.mass * b.vel) / m,
                    m);
    }
};

// Velocity change on a body at `target` from a point mass `source_mass` at `source`:
// dt * G * m * (source - target) / |source - target|^3.
// Coincident positions give a non-finite result; callers keep bodies separated.
inline Vector2d gravity_kick(const Vector2d& target, const Vector2d& source,
                             double source_mass, double G, double dt) {
    const Vector2d r = source - target;
    const double dist = r.norm();
    return (dt * G * source_mass / (dist * dist * dist)) * r;
}
