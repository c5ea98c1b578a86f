#include <iostream>
#include <fstream>
#include <vector>
#include <string>

#include <H5Cpp.h>

#include "config.hpp"
#include "models.hpp"
#include "basin.hpp"
#include "raster_h5.hpp"

//---------------------------------------------------------------------------
void save_text(const basins::raster &r);

//---------------------------------------------------------------------------
int main(int argc, char *argv[]) {
    try {
        config::read(argc, argv);

        const basins::model_info &model = basins::find_model(config::model);
        basins::vector_field f = basins::make_vector_field(config::model, config::param);

        std::vector<basins::point> attractors = config::attractors();
        basins::region r = {config::xmin, config::xmax, config::ymin, config::ymax};

        basins::basin_options opt;
        opt.dim                = model.dim;
        opt.clear_corner       = config::clear_corner;
        opt.solver.dt          = config::dt;
        opt.solver.abs_tol     = config::abs_tol;
        opt.solver.rel_tol     = config::rel_tol;
        opt.solver.max_steps   = config::max_steps;
        opt.solver.workers     = config::workers;

        basins::grid g = basins::make_grid(r, config::delta);

        std::cout
            << "Model:      " << model.name << std::endl
            << "Grid:       " << g.nx() << " x " << g.ny() << std::endl
            << "Attractors: " << attractors.size() << std::endl
            << "Workers:    "
            << (opt.solver.workers ? opt.solver.workers : basins::default_workers())
            << std::endl;

        basins::batch_report report;
        basins::raster basin = basins::attractor_basin(
                f, config::param, attractors, config::maxdist,
                r, config::delta, config::tmax, opt, &report);

        if (report.failed)
            std::cout
                << "Failed trajectories: " << report.failed
                << " (first at grid point " << report.first_failed << ": "
                << report.first_error << ")" << std::endl;

        std::vector<size_t> count = basins::label_counts(basin, static_cast<int>(attractors.size()));
        for(size_t m = 0; m < count.size(); ++m)
            std::cout << "Label " << m << ": " << count[m] << std::endl;

        basins::basin_metadata meta;
        meta.model      = model.name;
        meta.bounds     = r;
        meta.delta      = config::delta;
        meta.tmax       = config::tmax;
        meta.maxdist    = config::maxdist;
        meta.params     = config::param;
        meta.attractors = attractors;

        basins::save_raster(config::out, basin, meta);

        if (!config::txt.empty()) save_text(basin);
    } catch (const H5::Exception &e) {
        std::cerr << "HDF5 error: " << e.getDetailMsg() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

//---------------------------------------------------------------------------
void save_text(const basins::raster &r) {
    std::ofstream f(config::txt);
    if (!f) throw std::runtime_error("can not open " + config::txt);
    basins::write_text(f, r);
}
