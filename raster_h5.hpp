#ifndef RASTER_H5_HPP
#define RASTER_H5_HPP

#include <string>
#include <vector>

#include "common.hpp"
#include "grid.hpp"
#include "raster.hpp"

namespace basins {

// Run description stored next to the labels.
struct basin_metadata {
    std::string        model;
    region             bounds;
    double             delta;
    double             tmax;
    double             maxdist;
    parameter_type     params;
    std::vector<point> attractors;
};

// Writes the raster to dataset /L of a new (truncated) HDF5 file, with the
// run description as dataset attributes. H5::Exception is propagated.
void save_raster(const std::string &fname, const raster &r, const basin_metadata &meta);

// Reads dataset /L back.
raster load_raster(const std::string &fname);

} // namespace basins

#endif
