#pragma once
#include "BodyStore.h"
#include <chrono>
#include <cstdint>
#include <vector>

class BarnesHutEngine {
public:
    struct Config {
        double gravitational_constant;
        size_t depth_limit;            // nodes at this depth stay leaves (coincident bodies)
        bool enable_threading;         // Enable OpenMP threading (if available)

        Config()
            : gravitational_constant(G_DEFAULT)
            , depth_limit(32)
            , enable_threading(true)
        {}
    };

    // Arena node. Members are the slots [first, last) of member_order_; children are arena
    // indices laid out as a 2x2 grid, children[row * 2 + col], UINT32_MAX when absent.
    struct QuadTreeNode {
        geom::Square square;
        double total_mass;
        Vector2d com;
        uint32_t first, last;
        uint32_t children[4];
        uint16_t depth;
        uint8_t is_leaf;

        QuadTreeNode()
            : square{0.0, 0.0, 0.0}, total_mass(0.0), com(Vector2d::Zero()),
              first(0), last(0), depth(0), is_leaf(1) {
            children[0] = children[1] = children[2] = children[3] = UINT32_MAX;
        }

        inline uint32_t member_count() const { return last - first; }
    };

    struct Stats {
        size_t node_count = 0;
        size_t leaf_count = 0;
        size_t max_depth = 0;
        size_t monopole_accepts = 0;   // aggregate kicks taken instead of refining
        size_t exact_kicks = 0;        // body-to-body kicks
    };

    explicit BarnesHutEngine(const Config& config = Config{});

    // theta is read once by the caller and passed in; the engine keeps no copy of it.
    std::chrono::nanoseconds apply(BodyStore& bodies, double dt, double theta);

    void build_tree(const BodySnapshot& snap);
    Vector2d kick_on_body(size_t i, const BodySnapshot& snap, double dt, double theta,
                          size_t& monopoles, size_t& exact) const;

    const Config& get_config() const { return config_; }
    const Stats& get_stats() const { return stats_; }

private:
    #ifdef GRAVSIM_TESTING
        friend struct GravSimTestHooks;
    #endif

    struct StackItem {
        uint32_t node_index;
        int depth;

        StackItem(uint32_t idx, int d) : node_index(idx), depth(d) {}
    };

    static constexpr size_t MAX_DEPTH_LIMIT = 60;
    static constexpr size_t TRAVERSAL_STACK_SIZE = 4 * MAX_DEPTH_LIMIT + 8;

    uint32_t create_node();
    void compute_aggregates(QuadTreeNode& node, const BodySnapshot& snap) const;
    void split_node(uint32_t node_index, const BodySnapshot& snap);

    inline int get_quadrant(const Vector2d& p, const geom::Square& sq) const {
        const int col = (p.x() >= sq.mid_x()) ? 1 : 0;
        const int row = (p.y() >= sq.mid_y()) ? 1 : 0;
        return (row << 1) | col;
    }

    inline bool is_member(const QuadTreeNode& node, size_t i) const {
        const uint32_t slot = body_slot_[i];
        return slot >= node.first && slot < node.last;
    }

    Config config_;
    Stats stats_;

    // Tree management
    std::vector<QuadTreeNode> tree_nodes_;
    uint32_t root_node_index_;
    std::vector<uint32_t> member_order_;    // snapshot indices grouped by node
    std::vector<uint32_t> body_slot_;       // snapshot index -> slot in member_order_
    std::vector<uint32_t> scratch_;
    std::vector<StackItem> node_stack_;

    std::vector<Vector2d> deltas_;
};
