// Implementation
#include "BodyStore.h"
#include <atomic>
#include <stdexcept>
#include <string>

BodyId BodyStore::next_id() {
    // Process-wide so independent copies of a store never hand out the same id.
    static std::atomic<BodyId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

BodyId BodyStore::insert(const Body& body) {
    if (!(body.mass > 0.0) || !std::isfinite(body.mass)) {
        throw std::invalid_argument("BodyStore::insert: mass must be positive and finite, got " +
                                    std::to_string(body.mass));
    }
    const BodyId id = next_id();
    bodies_.emplace(id, body);
    return id;
}

BodyId BodyStore::add_body(const Vector2d& pos, const Vector2d& vel, double mass) {
    return insert(Body(pos, vel, mass));
}

bool BodyStore::erase(BodyId id) {
    return bodies_.erase(id) != 0;
}

void BodyStore::remove(BodyId id) {
    if (!erase(id)) {
        throw std::out_of_range("BodyStore::remove: unknown body id " + std::to_string(id));
    }
}

BodyId BodyStore::merge(BodyId a, BodyId b) {
    const Body product = Body::merge(at(a), at(b));
    bodies_.erase(a);
    bodies_.erase(b);
    return insert(product);
}

BodySnapshot BodyStore::snapshot() const {
    BodySnapshot snap;
    const size_t N = bodies_.size();
    snap.ids.reserve(N);
    snap.positions.reserve(N);
    snap.masses.reserve(N);
    snap.radii.reserve(N);

    for (const auto& [id, body] : bodies_) {
        snap.ids.push_back(id);
        snap.positions.push_back(body.pos);
        snap.masses.push_back(body.mass);
        snap.radii.push_back(body.radius);
    }
    return snap;
}

void BodyStore::apply_velocity_deltas(const std::vector<BodyId>& ids, const std::vector<Vector2d>& dv) {
    if (ids.size() != dv.size()) {
        throw std::invalid_argument("BodyStore::apply_velocity_deltas: size mismatch");
    }
    for (size_t i = 0; i < ids.size(); ++i) {
        // at() throws if a force pass outlived a merge it should have been sequenced after
        bodies_.at(ids[i]).vel += dv[i];
    }
}

void BodyStore::drift(double t) {
    for (auto& [id, body] : bodies_) {
        body.pos += body.vel * t;
    }
}

void BodyStore::normalize_momentum() {
    const double M = total_mass();
    if (M <= 0.0) return;

    const Vector2d offset = -total_momentum() / M;
    for (auto& [id, body] : bodies_) {
        body.vel += offset;
    }
}

double BodyStore::total_mass() const {
    double m = 0.0;
    for (const auto& [id, body] : bodies_) m += body.mass;
    return m;
}

Vector2d BodyStore::total_momentum() const {
    Vector2d p = Vector2d::Zero();
    for (const auto& [id, body] : bodies_) p += body.momentum();
    return p;
}

Vector2d BodyStore::center_of_mass() const {
    const double M = total_mass();
    if (M <= 0.0) return Vector2d::Zero();

    Vector2d w = Vector2d::Zero();
    for (const auto& [id, body] : bodies_) w += body.mass * body.pos;
    return w / M;
}

geom::Rect BodyStore::bounding_rect() const {
    geom::Rect r = geom::Rect::empty();
    for (const auto& [id, body] : bodies_) {
        r.expand(body.pos.x(), body.pos.y(), body.radius);
    }
    return r;
}
