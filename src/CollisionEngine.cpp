#include "CollisionEngine.h"
#include <algorithm>
#include <cmath>
#include <iterator>

CollisionEngine::CollisionEngine(EventBus& event_bus, const Config& config)
    : config_(config), event_bus_(event_bus) {}


//===========================================================================================
//==                                   DETECTION                                           ==
//===========================================================================================

std::optional<double> CollisionEngine::contact_time(const Body& a, const Body& b, double horizon) {
    /*
     * Surfaces touch when |d + w t| = r, i.e. a t^2 + b t + c = 0 with
     *   d = p_a - p_b, w = v_a - v_b, r = R_a + R_b
     *   a = |w|^2, b = 2 d.w, c = |d|^2 - r^2
     * The smaller root is the ingress time. Pairs already in contact (c <= 0) touch now.
     *
     * INPUT:  a; b; horizon
     * OUTPUT: contact time in [0, horizon], or nothing
     * */
    const Vector2d d = a.pos - b.pos;
    const Vector2d w = a.vel - b.vel;
    const double r = a.radius + b.radius;

    const double qa = w.squaredNorm();
    const double qb = 2.0 * d.dot(w);
    const double qc = d.squaredNorm() - r * r;

    if (qc <= 0.0) {
        return 0.0;
    }
    if (qa == 0.0) {
        return std::nullopt;
    }

    // b^2 - 4ac == 4 (|w|^2 r^2 - (d x w)^2); the plain form rounds to zero once |d| >> r.
    // Separating pairs (b >= 0) have both roots behind them.
    const double cross = d.x() * w.y() - d.y() * w.x();
    const double disc = 4.0 * (qa * r * r - cross * cross);
    if (!(qb < 0.0) || !(disc >= 0.0)) {
        return std::nullopt;
    }

    // smaller root 2c / (-b + sqrt(D)), positive since c > 0 and b < 0
    const double t = std::max(0.0, 2.0 * qc / (-qb + std::sqrt(disc)));
    if (t > horizon) {
        return std::nullopt;
    }
    return t;
}

std::optional<CollisionEngine::Contact> CollisionEngine::find_earliest_collision(
    const BodyStore& bodies, double horizon) const {
    std::optional<Contact> best;

    for (auto it = bodies.begin(); it != bodies.end(); ++it) {
        for (auto jt = std::next(it); jt != bodies.end(); ++jt) {
            const auto t = contact_time(it->second, jt->second, horizon);
            if (!t) continue;
            // strict comparison keeps the first pair in id order on ties
            if (!best || *t < best->time) {
                best = Contact{it->first, jt->first, *t};
            }
        }
    }
    return best;
}

std::optional<CollisionEngine::Contact> CollisionEngine::find_deepest_overlap(const BodyStore& bodies) const {
    std::optional<Contact> deepest;
    double best_depth = 0.0;

    for (auto it = bodies.begin(); it != bodies.end(); ++it) {
        const Body& a = it->second;
        for (auto jt = std::next(it); jt != bodies.end(); ++jt) {
            const Body& b = jt->second;
            const double depth = a.radius + b.radius - (a.pos - b.pos).norm();
            if (depth > best_depth) {
                best_depth = depth;
                deepest = Contact{it->first, jt->first, 0.0};
            }
        }
    }
    return deepest;
}


//===========================================================================================
//==                                   RESOLUTION                                          ==
//===========================================================================================

BodyId CollisionEngine::merge_pair(BodyStore& bodies, BodyId a, BodyId b, double time_in_tick) {
    const BodyId product = bodies.merge(a, b);

    ++last_tick_.merge_count;
    BodiesMergedEvent event{a, b, product, bodies.at(product).mass, time_in_tick};
    event_bus_.emit(Events::BODIES_MERGED, event);

    return product;
}

size_t CollisionEngine::settle_overlaps(BodyStore& bodies, double time_in_tick) {
    // Each merge removes a body, so this runs at most size() - 1 times
    size_t merges = 0;
    while (auto overlap = find_deepest_overlap(bodies)) {
        merge_pair(bodies, overlap->first, overlap->second, time_in_tick);
        ++merges;
    }
    last_tick_.settle_merges += merges;
    return merges;
}

void CollisionEngine::advance(BodyStore& bodies, double dt) {
    last_tick_ = TickStats{};

    double remaining = dt;
    double elapsed = 0.0;

    if (config_.settle_at_start) {
        settle_overlaps(bodies, 0.0);
    }

    while (true) {
        const auto contact = find_earliest_collision(bodies, remaining);
        if (!contact) {
            bodies.drift(remaining);
            break;
        }

        bodies.drift(contact->time);
        elapsed += contact->time;
        remaining -= contact->time;
        ++last_tick_.collision_steps;

        merge_pair(bodies, contact->first, contact->second, elapsed);
        settle_overlaps(bodies, elapsed);
    }
}
