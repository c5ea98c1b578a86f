#ifndef RASTER_HPP
#define RASTER_HPP

#include <vector>
#include <iosfwd>
#include <cstddef>

#include "grid.hpp"

namespace basins {

// nx x ny label matrix, row major: entry (i, j) belongs to (x[i], y[j]).
struct raster {
    size_t nx, ny;
    std::vector<int> labels;

    raster() : nx(0), ny(0) {}
    raster(size_t nx, size_t ny) : nx(nx), ny(ny), labels(nx * ny, 0) {}

    int& operator()(size_t i, size_t j) { return labels[i * ny + j]; }
    int  operator()(size_t i, size_t j) const { return labels[i * ny + j]; }
};

// Arranges per-point labels (in grid order) into a raster.
raster assemble_raster(const grid &g, const std::vector<int> &labels);

// Forces entry (0, 0) to the unclassified label. Plotting tools anchor the
// colour scale on the first cell, so the corner must hold label 0.
void clear_corner(raster &r);

// Number of cells per label, for labels 0..nlabels.
std::vector<size_t> label_counts(const raster &r, int nlabels);

// Writes one line per grid row i, labels separated by spaces.
void write_text(std::ostream &os, const raster &r);

} // namespace basins

#endif
