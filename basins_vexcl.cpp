#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <cmath>

#include <H5Cpp.h>

#include <vexcl/vexcl.hpp>

#include <boost/array.hpp>
#include <boost/numeric/odeint.hpp>
#include <boost/numeric/odeint/external/vexcl/vexcl.hpp>

#include "config.hpp"
#include "models.hpp"
#include "grid.hpp"
#include "classify.hpp"
#include "raster.hpp"
#include "raster_h5.hpp"

namespace odeint = boost::numeric::odeint;

typedef vex::symbolic<double>       sym_vector;
typedef boost::array<sym_vector, 2> sym_state2;
typedef boost::array<sym_vector, 3> sym_state3;

//---------------------------------------------------------------------------
template <class System>
vex::generator::Kernel<2> make_kernel_2d(const vex::Context &ctx, const System &sys, double dt);

template <class System>
vex::generator::Kernel<3> make_kernel_3d(const vex::Context &ctx, const System &sys, double dt);

//---------------------------------------------------------------------------
int main(int argc, char *argv[]) {
    try {
        config::read(argc, argv);

        const basins::model_info &model = basins::find_model(config::model);
        const basins::parameter_type &p = config::param;

        // Checks the parameter count.
        basins::make_vector_field(config::model, p);

        std::vector<basins::point> attractors = config::attractors();
        basins::check_attractors(attractors, config::maxdist);

        if (!(config::tmax > 0) || !(config::dt > 0))
            throw basins::configuration_error("tmax and dt must be positive");

        basins::region r = {config::xmin, config::xmax, config::ymin, config::ymax};
        basins::grid   g = basins::make_grid(r, config::delta);
        const size_t   n = g.size();

        // Initialize VexCL context
        vex::Context ctx( vex::Filter::Env && vex::Filter::DoublePrecision );
        if (!ctx) throw std::runtime_error("no OpenCL device with double precision support");
        std::cout << ctx << std::endl;

        std::cout
            << "Model:      " << model.name << std::endl
            << "Grid:       " << g.nx() << " x " << g.ny() << std::endl
            << "Attractors: " << attractors.size() << std::endl;

        // Fixed steps of at most dt, landing exactly on tmax.
        const long   steps = static_cast<long>(std::ceil(config::tmax / config::dt));
        const double h     = config::tmax / steps;

        // Set initial position.
        vex::vector<double> x(ctx, n);
        vex::vector<double> y(ctx, n);
        vex::vector<double> z(ctx, n);

        x = config::xmin + config::delta * (vex::element_index() / g.ny());
        y = config::ymin + config::delta * (vex::element_index() % g.ny());
        z = 0;

        // Integrate over time.
        if (model.name == "duffing") {
            auto step = make_kernel_2d(ctx,
                    basins::duffing_system<sym_state2, double>(p[0], p[1]), h);
            for(long iter = 0; iter < steps; ++iter) step(x, y);
        } else if (model.name == "duffing_forced") {
            auto step = make_kernel_3d(ctx,
                    basins::duffing_forced_system<sym_state3, double>(p[0], p[1], p[2], p[3]), h);
            for(long iter = 0; iter < steps; ++iter) step(x, y, z);
        } else if (model.name == "vdp_forced") {
            auto step = make_kernel_3d(ctx,
                    basins::vdp_forced_system<sym_state3, double>(p[0], p[1], p[2]), h);
            for(long iter = 0; iter < steps; ++iter) step(x, y, z);
        } else {
            throw basins::configuration_error("model " + model.name + " has no device kernel");
        }

        std::vector<double> x_host(n), y_host(n);
        vex::copy(x, x_host);
        vex::copy(y, y_host);

        // Diverged trajectories are unclassified.
        std::vector<basins::trajectory_outcome> terminal(n);
        size_t failed = 0;
        for(size_t k = 0; k < n; ++k) {
            if (std::isfinite(x_host[k]) && std::isfinite(y_host[k]))
                terminal[k] = basins::state_type{x_host[k], y_host[k]};
            else
                ++failed;
        }

        basins::raster basin = basins::assemble_raster(g,
                basins::classify_batch(terminal, attractors, config::maxdist));
        if (config::clear_corner) basins::clear_corner(basin);

        if (failed) std::cout << "Failed trajectories: " << failed << std::endl;

        std::vector<size_t> count = basins::label_counts(basin, static_cast<int>(attractors.size()));
        for(size_t m = 0; m < count.size(); ++m)
            std::cout << "Label " << m << ": " << count[m] << std::endl;

        basins::basin_metadata meta;
        meta.model      = model.name;
        meta.bounds     = r;
        meta.delta      = config::delta;
        meta.tmax       = config::tmax;
        meta.maxdist    = config::maxdist;
        meta.params     = p;
        meta.attractors = attractors;

        basins::save_raster(config::out, basin, meta);
    } catch (const vex::backend::error &e) {
        std::cerr << "VexCL error: " << e << std::endl;
        return 1;
    } catch (const H5::Exception &e) {
        std::cerr << "HDF5 error: " << e.getDetailMsg() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

//---------------------------------------------------------------------------
// Generate monolythic kernels that do a single Runge-Kutta step.
//---------------------------------------------------------------------------
template <class System>
vex::generator::Kernel<2> make_kernel_2d(const vex::Context &ctx, const System &sys, double dt) {
    // Kernel body will be recorded here:
    std::ostringstream body;
    vex::generator::set_recorder(body);

    // Symbolic variables. These will be fed to odeint algorithm.
    sym_state2 x = {{
        sym_vector(sym_vector::VectorParameter),
        sym_vector(sym_vector::VectorParameter)
    }};

    // Stepper type
    odeint::runge_kutta4_classic<
        sym_state2, double, sym_state2, double,
        odeint::range_algebra, odeint::default_operations
        > stepper;

    // Record single RK4 step
    stepper.do_step(std::ref(sys), x, 0, dt);

    // Generate the kernel from the recorded sequence
    return vex::generator::build_kernel(ctx, "basin_step_2d", body.str(), x[0], x[1]);
}

//---------------------------------------------------------------------------
template <class System>
vex::generator::Kernel<3> make_kernel_3d(const vex::Context &ctx, const System &sys, double dt) {
    std::ostringstream body;
    vex::generator::set_recorder(body);

    sym_state3 x = {{
        sym_vector(sym_vector::VectorParameter),
        sym_vector(sym_vector::VectorParameter),
        sym_vector(sym_vector::VectorParameter)
    }};

    odeint::runge_kutta4_classic<
        sym_state3, double, sym_state3, double,
        odeint::range_algebra, odeint::default_operations
        > stepper;

    stepper.do_step(std::ref(sys), x, 0, dt);

    return vex::generator::build_kernel(ctx, "basin_step_3d", body.str(), x[0], x[1], x[2]);
}
