#pragma once
#include "BodyStore.h"
#include <chrono>
#include <cstdint>
#include <vector>

// Uniform grid over the bounding rectangle. Cells near a body contribute exact pairwise
// kicks, every other non-empty cell a single monopole kick from its center of mass.
class GridEngine {
public:
    struct Config {
        double gravitational_constant;
        double tau;                  // area-to-count ratio driving the target cell side
        int neighborhood_radius;     // 1 = 3x3 Moore neighborhood
        bool enable_threading;

        Config()
            : gravitational_constant(G_DEFAULT)
            , tau(0.3)
            , neighborhood_radius(1)
            , enable_threading(true)
        {}
    };

    struct Cell {
        std::vector<uint32_t> members;   // snapshot indices
        double total_mass;
        Vector2d com;

        Cell() : total_mass(0.0), com(Vector2d::Zero()) {}
    };

    explicit GridEngine(const Config& config = Config{});

    std::chrono::nanoseconds apply(BodyStore& bodies, double dt);

    const Config& get_config() const { return config_; }

    size_t get_rows() const { return rows_; }
    size_t get_columns() const { return columns_; }

private:
    #ifdef GRAVSIM_TESTING
        friend struct GravSimTestHooks;
    #endif

    void build_grid(const BodySnapshot& snap);
    void compute_deltas(const BodySnapshot& snap, double dt);

    inline Cell& cell_at(size_t row, size_t col) { return cells_[row * columns_ + col]; }
    inline const Cell& cell_at(size_t row, size_t col) const { return cells_[row * columns_ + col]; }

    Config config_;

    geom::Rect rect_;
    size_t rows_;
    size_t columns_;
    double cell_width_;
    double cell_height_;

    std::vector<Cell> cells_;               // row-major
    std::vector<uint32_t> body_row_, body_col_;
    std::vector<Vector2d> deltas_;
};
