#include "GridEngine.h"
#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

GridEngine::GridEngine(const Config& config)
    : config_(config), rect_(geom::Rect::empty()), rows_(0), columns_(0),
      cell_width_(0.0), cell_height_(0.0) {}


//===========================================================================================
//==                                   GRID BUILDING                                       ==
//===========================================================================================

void GridEngine::build_grid(const BodySnapshot& snap) {
    /*
     * 1. Radius-expanded bounding rectangle
     * 2. Target side s = sqrt(tau * w * h / sqrt(N)); rows from h/s, columns from the
     *    resulting cell height so cells stay close to square. At most ceil(N / tau) cells.
     * 3. Bucket by integer-divided offset from the corner, accumulate mass and mass-weighted
     *    position, then finalize the centers of mass
     *
     * INPUT:  snap
     * OUTPUT: rect_, rows_, columns_, cell_width_, cell_height_, cells_, body_row_/col_
     * */
    const size_t N = snap.size();

    rect_ = geom::Rect::empty();
    for (size_t i = 0; i < N; ++i) {
        rect_.expand(snap.positions[i].x(), snap.positions[i].y(), snap.radii[i]);
    }

    const double width = rect_.width();
    const double height = rect_.height();
    const double target_size = std::sqrt((config_.tau * width * height) / std::sqrt(double(N)));

    // A thin strip would otherwise get one cell per body-width of span
    const double max_cells = std::max(1.0, std::ceil(double(N) / config_.tau));

    rows_ = static_cast<size_t>(std::clamp(std::round(height / target_size), 1.0, max_cells));
    cell_height_ = height / double(rows_);

    const double max_columns = std::max(1.0, std::floor(max_cells / double(rows_)));
    columns_ = static_cast<size_t>(std::clamp(std::round(width / cell_height_), 1.0, max_columns));
    cell_width_ = width / double(columns_);

    cells_.assign(rows_ * columns_, Cell{});
    body_row_.resize(N);
    body_col_.resize(N);

    for (size_t i = 0; i < N; ++i) {
        const Vector2d& p = snap.positions[i];
        // floor of a non-negative offset; clamp guards rounding at the far edge
        const size_t row = std::min<size_t>(rows_ - 1,
            static_cast<size_t>(std::max(0.0, (p.y() - rect_.min_y) / cell_height_)));
        const size_t col = std::min<size_t>(columns_ - 1,
            static_cast<size_t>(std::max(0.0, (p.x() - rect_.min_x) / cell_width_)));

        body_row_[i] = static_cast<uint32_t>(row);
        body_col_[i] = static_cast<uint32_t>(col);

        Cell& cell = cell_at(row, col);
        cell.members.push_back(static_cast<uint32_t>(i));
        cell.total_mass += snap.masses[i];
        cell.com += snap.masses[i] * p;
    }

    for (Cell& cell : cells_) {
        if (cell.total_mass != 0.0) {
            cell.com /= cell.total_mass;
        }
    }
}


//===========================================================================================
//==                                  CALCULATIONS                                         ==
//===========================================================================================

void GridEngine::compute_deltas(const BodySnapshot& snap, double dt) {
    const size_t N = snap.size();
    deltas_.assign(N, Vector2d::Zero());

    const double G = config_.gravitational_constant;
    const long long radius = std::max(0, config_.neighborhood_radius);

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic, 16) if(config_.enable_threading && N > 256)
    #endif
    for (long long ii = 0; ii < (long long)N; ++ii) {
        const size_t i = (size_t)ii;
        const Vector2d& p = snap.positions[i];
        const long long row = body_row_[i];
        const long long col = body_col_[i];

        Vector2d acc = Vector2d::Zero();
        for (size_t m = 0; m < rows_; ++m) {
            const bool near_row = std::llabs((long long)m - row) <= radius;
            for (size_t n = 0; n < columns_; ++n) {
                const Cell& cell = cell_at(m, n);
                if (cell.total_mass <= 0.0) continue;

                if (near_row && std::llabs((long long)n - col) <= radius) {
                    for (uint32_t j : cell.members) {
                        if (j == i) continue;
                        acc += gravity_kick(p, snap.positions[j], snap.masses[j], G, dt);
                    }
                } else {
                    acc += gravity_kick(p, cell.com, cell.total_mass, G, dt);
                }
            }
        }
        deltas_[i] = acc;
    }
}

std::chrono::nanoseconds GridEngine::apply(BodyStore& bodies, double dt) {
    auto start = std::chrono::high_resolution_clock::now();

    if (!bodies.empty()) {
        const BodySnapshot snap = bodies.snapshot();
        build_grid(snap);
        compute_deltas(snap, dt);
        bodies.apply_velocity_deltas(snap.ids, deltas_);
    }

    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now() - start);
}
