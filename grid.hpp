#ifndef GRID_HPP
#define GRID_HPP

#include <vector>
#include <cstddef>

#include "common.hpp"

namespace basins {

// Axis-aligned rectangle in the (x, y) plane.
struct region {
    double xmin, xmax;
    double ymin, ymax;
};

// Regular lattice over a region. Point n = i * ny + j sits at (x[i], y[j]).
struct grid {
    std::vector<double> x;
    std::vector<double> y;

    size_t nx() const { return x.size(); }
    size_t ny() const { return y.size(); }
    size_t size() const { return x.size() * y.size(); }

    size_t index(size_t i, size_t j) const { return i * y.size() + j; }
};

// Number of samples in [lo, hi] at spacing delta. The upper end is included
// when it is reached (up to rounding), otherwise the last sample falls short.
size_t axis_size(double lo, double hi, double delta);

// Samples lo, lo + delta, ... as counted by axis_size().
std::vector<double> axis(double lo, double hi, double delta);

// Throws configuration_error for non-finite or inverted bounds, or for
// non-positive delta.
grid make_grid(const region &r, double delta);

// Initial states for every grid point, in grid order. Coordinates beyond the
// first two (e.g. a forcing phase) start at zero.
std::vector<state_type> initial_states(const grid &g, unsigned dim = 2);

} // namespace basins

#endif
