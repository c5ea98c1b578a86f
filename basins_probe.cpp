#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>

#include <boost/numeric/odeint.hpp>

#include "config.hpp"
#include "models.hpp"
#include "grid.hpp"
#include "integrate.hpp"
#include "classify.hpp"

namespace odeint = boost::numeric::odeint;

//---------------------------------------------------------------------------
// Follows a single initial condition: the trajectory goes to trajectory.dat
// (time and state at every accepted step), the terminal state and its label
// to stdout. Handy for locating attractors before a full basin run.
//---------------------------------------------------------------------------
int main(int argc, char *argv[]) {
    try {
        config::read(argc, argv);

        const basins::model_info &model = basins::find_model(config::model);
        basins::vector_field f = basins::make_vector_field(config::model, config::param);

        std::vector<basins::point> attractors = config::attractors();
        basins::check_attractors(attractors, config::maxdist);

        basins::state_type x(model.dim, 0.0);
        x[0] = config::x0;
        x[1] = config::y0;

        basins::solver_options opt;
        opt.dt        = config::dt;
        opt.abs_tol   = config::abs_tol;
        opt.rel_tol   = config::rel_tol;
        opt.max_steps = config::max_steps;
        basins::check_solver_options(opt, config::tmax);

        const basins::parameter_type &p = config::param;

        // Fails here, before any output, when the trajectory does not make it.
        basins::state_type u = basins::integrate_terminal(f, p, x, config::tmax, opt);

        // Same stepper and settings as above, so the last line of the dump is
        // the terminal state classified below.
        typedef odeint::runge_kutta_dopri5<basins::state_type> error_stepper_type;

        auto sys = [&f, &p](const basins::state_type &x, basins::state_type &dxdt, double t) {
            f(x, dxdt, p, t);
        };

        {
            std::ofstream traj("trajectory.dat");
            if (!traj) throw std::runtime_error("can not open trajectory.dat");

            basins::state_type v = x;
            odeint::integrate_adaptive(
                    odeint::make_controlled<error_stepper_type>(opt.abs_tol, opt.rel_tol),
                    std::ref(sys), v, 0.0, config::tmax, std::min(opt.dt, config::tmax),
                    [&traj](const basins::state_type &v, double t) {
                        traj << t;
                        for(double c : v) traj << " " << c;
                        traj << "\n";
                    });
        }

        std::cout << "Terminal state:";
        for(double v : u) std::cout << " " << v;
        std::cout << std::endl;

        for(size_t m = 0; m < attractors.size(); ++m)
            std::cout
                << "Distance to attractor " << m + 1 << ": "
                << basins::distance2d(u, attractors[m]) << std::endl;

        std::cout << "Label: " << basins::classify(u, attractors, config::maxdist) << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
