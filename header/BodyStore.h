#pragma once
#include "Body.h"
#include "Bounds.hpp"
#include <map>
#include <vector>

// Flat view of the store taken at the start of a force pass. Index i of every array
// refers to the same body; ids are in ascending order.
struct BodySnapshot {
    std::vector<BodyId> ids;
    std::vector<Vector2d> positions;
    std::vector<double> masses;
    std::vector<double> radii;

    size_t size() const { return ids.size(); }
};

class BodyStore {
public:
    using Map = std::map<BodyId, Body>;

    BodyStore() = default;

    // Body management. insert() issues a fresh identity.
    BodyId insert(const Body& body);
    BodyId add_body(const Vector2d& pos, const Vector2d& vel, double mass);
    bool erase(BodyId id);
    void remove(BodyId id);   // throws std::out_of_range on an unknown id
    void clear() { bodies_.clear(); }

    // Replaces `a` and `b` with their inelastic merge; returns the product's id.
    BodyId merge(BodyId a, BodyId b);

    bool contains(BodyId id) const { return bodies_.count(id) != 0; }
    const Body& at(BodyId id) const { return bodies_.at(id); }

    // Bodies are read-only outside the store so mass and radius never drift apart.
    // Velocity is the one field callers may set; throws std::out_of_range on an unknown id.
    void set_velocity(BodyId id, const Vector2d& vel) { bodies_.at(id).vel = vel; }

    size_t size() const { return bodies_.size(); }
    bool empty() const { return bodies_.empty(); }

    Map::const_iterator begin() const { return bodies_.begin(); }
    Map::const_iterator end() const { return bodies_.end(); }

    // Force engine support
    BodySnapshot snapshot() const;
    void apply_velocity_deltas(const std::vector<BodyId>& ids, const std::vector<Vector2d>& dv);

    // Kinematics
    void drift(double t);
    void normalize_momentum();

    // Aggregates
    double total_mass() const;
    Vector2d total_momentum() const;
    Vector2d center_of_mass() const;
    geom::Rect bounding_rect() const;

    static BodyId next_id();

private:
    Map bodies_;
};
