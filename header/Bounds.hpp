#pragma once
#include <algorithm>
#include <cmath>
#include <limits>

namespace geom {

struct Rect {
    double min_x, min_y, max_x, max_y;

    double width()  const noexcept { return max_x - min_x; }
    double height() const noexcept { return max_y - min_y; }
    bool valid() const noexcept {
        return std::isfinite(min_x) && std::isfinite(min_y) &&
               std::isfinite(max_x) && std::isfinite(max_y) &&
               max_x >= min_x && max_y >= min_y;
    }

    static Rect empty() noexcept {
        constexpr double inf = std::numeric_limits<double>::infinity();
        return Rect{inf, inf, -inf, -inf};
    }

    // Grow to cover a disc of radius r at (x, y).
    void expand(double x, double y, double r) noexcept {
        min_x = std::min(min_x, x - r);
        min_y = std::min(min_y, y - r);
        max_x = std::max(max_x, x + r);
        max_y = std::max(max_y, y + r);
    }

    bool contains(double x, double y) const noexcept {
        return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }
};

struct Square {
    double min_x, min_y, size;

    double max_x() const noexcept { return min_x + size; }
    double max_y() const noexcept { return min_y + size; }
    double mid_x() const noexcept { return min_x + 0.5 * size; }
    double mid_y() const noexcept { return min_y + 0.5 * size; }

    // Pads the shorter axis of `r` equally on both sides.
    static Square enclosing(const Rect& r) noexcept {
        const double w = r.width();
        const double h = r.height();
        if (w >= h) {
            return Square{r.min_x, r.min_y - 0.5 * (w - h), w};
        }
        return Square{r.min_x - 0.5 * (h - w), r.min_y, h};
    }

    // row 0 is the low-y half, col 0 the low-x half
    Square quadrant(int row, int col) const noexcept {
        const double half = 0.5 * size;
        return Square{min_x + col * half, min_y + row * half, half};
    }

    bool contains(double x, double y) const noexcept {
        return x >= min_x && x <= max_x() && y >= min_y && y <= max_y();
    }
};

} // namespace geom
