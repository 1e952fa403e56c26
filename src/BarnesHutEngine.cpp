#include "BarnesHutEngine.h"
#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

BarnesHutEngine::BarnesHutEngine(const Config& config)
    : config_(config), root_node_index_(UINT32_MAX) {
    if (config_.depth_limit > MAX_DEPTH_LIMIT) {
        std::cout << "BarnesHutEngine: depth limit " << config_.depth_limit
                  << " clamped to " << MAX_DEPTH_LIMIT << "\n";
        config_.depth_limit = MAX_DEPTH_LIMIT;
    }
}


//===========================================================================================
//==                                   TREE BUILDING                                       ==
//===========================================================================================

uint32_t BarnesHutEngine::create_node() {
    tree_nodes_.emplace_back();
    return static_cast<uint32_t>(tree_nodes_.size() - 1);
}

void BarnesHutEngine::compute_aggregates(QuadTreeNode& node, const BodySnapshot& snap) const {
    const uint32_t cnt = node.member_count();
    if (cnt == 0) {
        node.total_mass = 0.0;
        node.com = Vector2d::Zero();
        return;
    }
    if (cnt == 1) {
        // exact copy so a single-body node kicks like the body itself
        const uint32_t gi = member_order_[node.first];
        node.total_mass = snap.masses[gi];
        node.com = snap.positions[gi];
        return;
    }

    double total_m = 0.0;
    Vector2d weighted = Vector2d::Zero();
    for (uint32_t s = node.first; s < node.last; ++s) {
        const uint32_t gi = member_order_[s];
        total_m += snap.masses[gi];
        weighted += snap.masses[gi] * snap.positions[gi];
    }

    node.total_mass = total_m;
    node.com = (total_m > 0.0) ? Vector2d(weighted / total_m) : Vector2d::Zero();
}

void BarnesHutEngine::split_node(uint32_t node_index, const BodySnapshot& snap) {
    /*
     * 1. Classify each member slot into its quadrant (row from y, column from x)
     * 2. Counting pass groups the parent's range into 4 contiguous child ranges,
     *    preserving the relative order of members
     * 3. Creates all 4 children, computes their aggregates and queues them
     *
     * INPUT:  node_index (must have >= 2 members and be above the depth limit)
     * OUTPUT: member_order_/body_slot_ regrouped, 4 new arena nodes pushed on node_stack_
     * */
    const uint32_t first = tree_nodes_[node_index].first;
    const uint32_t last = tree_nodes_[node_index].last;
    const geom::Square sq = tree_nodes_[node_index].square;
    const int depth = tree_nodes_[node_index].depth;

    std::array<uint32_t, 4> counts{0, 0, 0, 0};
    for (uint32_t s = first; s < last; ++s) {
        ++counts[get_quadrant(snap.positions[member_order_[s]], sq)];
    }

    std::array<uint32_t, 5> offsets{};
    offsets[0] = first;
    for (int q = 0; q < 4; ++q) offsets[q + 1] = offsets[q] + counts[q];
    assert(offsets[4] == last);

    std::array<uint32_t, 4> cursor{offsets[0], offsets[1], offsets[2], offsets[3]};
    for (uint32_t s = first; s < last; ++s) {
        const uint32_t gi = member_order_[s];
        scratch_[cursor[get_quadrant(snap.positions[gi], sq)]++] = gi;
    }
    for (uint32_t s = first; s < last; ++s) {
        member_order_[s] = scratch_[s];
        body_slot_[scratch_[s]] = s;
    }

    uint32_t child_indices[4];
    for (int q = 0; q < 4; ++q) {
        child_indices[q] = create_node();   // may reallocate; re-fetch nodes by index below
        QuadTreeNode& child = tree_nodes_[child_indices[q]];
        child.square = sq.quadrant(q >> 1, q & 1);
        child.first = offsets[q];
        child.last = offsets[q + 1];
        child.depth = static_cast<uint16_t>(depth + 1);
        child.is_leaf = 1;
        compute_aggregates(child, snap);
    }

    QuadTreeNode& parent = tree_nodes_[node_index];
    parent.is_leaf = 0;
    for (int q = 0; q < 4; ++q) {
        parent.children[q] = child_indices[q];
    }
    for (int q = 3; q >= 0; --q) {
        node_stack_.emplace_back(child_indices[q], depth + 1);
    }
}

void BarnesHutEngine::build_tree(const BodySnapshot& snap) {
    tree_nodes_.clear();
    node_stack_.clear();
    stats_ = Stats{};
    root_node_index_ = UINT32_MAX;

    const size_t N = snap.size();
    if (N == 0) return;

    member_order_.resize(N);
    body_slot_.resize(N);
    scratch_.resize(N);
    for (size_t i = 0; i < N; ++i) {
        member_order_[i] = static_cast<uint32_t>(i);
        body_slot_[i] = static_cast<uint32_t>(i);
    }

    tree_nodes_.reserve(std::max<size_t>(64, N * 2));

    geom::Rect rect = geom::Rect::empty();
    for (size_t i = 0; i < N; ++i) {
        rect.expand(snap.positions[i].x(), snap.positions[i].y(), snap.radii[i]);
    }

    root_node_index_ = create_node();
    QuadTreeNode& root = tree_nodes_[root_node_index_];
    root.square = geom::Square::enclosing(rect);
    root.first = 0;
    root.last = static_cast<uint32_t>(N);
    root.depth = 0;
    compute_aggregates(root, snap);

    const size_t depth_limit = std::clamp<size_t>(config_.depth_limit, 1, MAX_DEPTH_LIMIT);

    node_stack_.emplace_back(root_node_index_, 0);
    while (!node_stack_.empty()) {
        const StackItem item = node_stack_.back();
        node_stack_.pop_back();

        const QuadTreeNode& node = tree_nodes_[item.node_index];
        stats_.max_depth = std::max<size_t>(stats_.max_depth, static_cast<size_t>(item.depth));

        if (node.member_count() <= 1 || static_cast<size_t>(item.depth) >= depth_limit) {
            ++stats_.leaf_count;
            continue;
        }
        split_node(item.node_index, snap);
    }

    stats_.node_count = tree_nodes_.size();
}


//===========================================================================================
//==                                  CALCULATIONS                                         ==
//===========================================================================================

Vector2d BarnesHutEngine::kick_on_body(size_t i, const BodySnapshot& snap, double dt, double theta,
                                       size_t& monopoles, size_t& exact) const {
    if (UNLIKELY(root_node_index_ == UINT32_MAX)) return Vector2d::Zero();

    const double G = config_.gravitational_constant;
    const Vector2d& p = snap.positions[i];
    Vector2d acc = Vector2d::Zero();

    uint32_t stack[TRAVERSAL_STACK_SIZE];
    size_t top = 0;
    stack[top++] = root_node_index_;

    while (LIKELY(top > 0)) {
        const QuadTreeNode& node = tree_nodes_[stack[--top]];
        const uint32_t cnt = node.member_count();

        if (cnt == 0) continue;

        if (cnt == 1) {
            if (member_order_[node.first] != i) {
                acc += gravity_kick(p, node.com, node.total_mass, G, dt);
                ++exact;
            }
            continue;
        }

        const bool member = is_member(node, i);
        if (!member) {
            const double dist = (node.com - p).norm();
            if (node.square.size / dist <= theta) {
                acc += gravity_kick(p, node.com, node.total_mass, G, dt);
                ++monopoles;
                continue;
            }
        }

        if (node.is_leaf) {
            // Depth-limited bucket of near-coincident bodies: exact kicks, skipping self
            for (uint32_t s = node.first; s < node.last; ++s) {
                const uint32_t j = member_order_[s];
                if (j == i) continue;
                acc += gravity_kick(p, snap.positions[j], snap.masses[j], G, dt);
                ++exact;
            }
            continue;
        }

        assert(top + 4 <= TRAVERSAL_STACK_SIZE);
        // reversed so children pop in row-major order
        stack[top++] = node.children[3];
        stack[top++] = node.children[2];
        stack[top++] = node.children[1];
        stack[top++] = node.children[0];
    }

    return acc;
}

std::chrono::nanoseconds BarnesHutEngine::apply(BodyStore& bodies, double dt, double theta) {
    auto start = std::chrono::high_resolution_clock::now();

    if (bodies.empty()) {
        tree_nodes_.clear();
        root_node_index_ = UINT32_MAX;
        stats_ = Stats{};
        return std::chrono::nanoseconds(0);
    }

    const BodySnapshot snap = bodies.snapshot();
    build_tree(snap);

    const size_t N = snap.size();
    deltas_.assign(N, Vector2d::Zero());

    size_t monopoles = 0, exact = 0;

    #ifdef _OPENMP
    #pragma omp parallel for schedule(static) reduction(+:monopoles, exact) if(config_.enable_threading && N > 256)
    #endif
    for (long long ii = 0; ii < (long long)N; ++ii) {
        deltas_[(size_t)ii] = kick_on_body((size_t)ii, snap, dt, theta, monopoles, exact);
    }

    stats_.monopole_accepts = monopoles;
    stats_.exact_kicks = exact;

    bodies.apply_velocity_deltas(snap.ids, deltas_);

    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now() - start);
}
