#include "basin.hpp"
#include "classify.hpp"

namespace basins {

//---------------------------------------------------------------------------
raster attractor_basin(
        const vector_field &f, const parameter_type &p,
        const std::vector<point> &attractors, double maxdist,
        const region &r, double delta, double tmax,
        const basin_options &opt, batch_report *report
        )
{
    check_attractors(attractors, maxdist);

    if (!f) throw configuration_error("vector field is empty");
    check_solver_options(opt.solver, tmax);

    grid g = make_grid(r, delta);
    std::vector<state_type> u0 = initial_states(g, opt.dim);

    std::vector<trajectory_outcome> terminal = integrate_batch(
            f, p, u0, tmax, opt.solver, report);

    raster basin = assemble_raster(g, classify_batch(terminal, attractors, maxdist));

    if (opt.clear_corner) clear_corner(basin);

    return basin;
}

} // namespace basins
