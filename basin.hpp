#ifndef BASIN_HPP
#define BASIN_HPP

#include <vector>

#include "common.hpp"
#include "grid.hpp"
#include "integrate.hpp"
#include "raster.hpp"

namespace basins {

struct basin_options {
    solver_options solver;
    unsigned dim;           // state dimension the vector field expects
    bool     clear_corner;  // force raster(0, 0) to 0 after classification

    basin_options() : dim(3), clear_corner(true) {}
};

//---------------------------------------------------------------------------
// Basin of attraction raster.
//
// Every point of the grid over r with spacing delta is lifted to a state of
// opt.dim coordinates (extra ones zero), integrated with f to tmax and
// labelled with the first attractor within maxdist of its (x, y) terminal
// position. Trajectories that fail or end near no attractor get label 0.
//
// The whole setup is checked before the first trajectory is integrated;
// configuration_error is thrown for more than max_attractors attractors and
// for any other unusable argument.
//---------------------------------------------------------------------------
raster attractor_basin(
        const vector_field &f, const parameter_type &p,
        const std::vector<point> &attractors, double maxdist,
        const region &r, double delta, double tmax,
        const basin_options &opt = basin_options(),
        batch_report *report = 0
        );

} // namespace basins

#endif
