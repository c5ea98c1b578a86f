#include <cmath>
#include <sstream>
#include <algorithm>
#include <functional>

#include <omp.h>

#include <boost/numeric/odeint.hpp>

#include "integrate.hpp"

namespace odeint = boost::numeric::odeint;

namespace basins {

namespace {

//---------------------------------------------------------------------------
// Binds the parameter vector so odeint sees the usual (x, dxdt, t) system.
//---------------------------------------------------------------------------
struct bound_system {
    const vector_field   &f;
    const parameter_type &p;

    bound_system(const vector_field &f, const parameter_type &p)
        : f(f), p(p) {}

    void operator()(const state_type &x, state_type &dxdt, double t) const {
        const size_t n = x.size();
        f(x, dxdt, p, t);
        if (dxdt.size() != n) {
            std::ostringstream s;
            s << "vector field returned " << dxdt.size()
              << " derivatives for a state of size " << n;
            throw integration_error(s.str());
        }
    }
};

//---------------------------------------------------------------------------
// Called after every accepted step. Stops runaway trajectories.
//---------------------------------------------------------------------------
struct step_guard {
    size_t max_steps;
    size_t steps;

    explicit step_guard(size_t max_steps) : max_steps(max_steps), steps(0) {}

    void operator()(const state_type &x, double t) {
        for(double v : x) {
            if (!std::isfinite(v)) {
                std::ostringstream s;
                s << "state is not finite at t = " << t;
                throw integration_error(s.str());
            }
        }

        // The first call sees the initial state, so steps counts the
        // accepted steps taken before this call.
        if (steps++ > max_steps) {
            std::ostringstream s;
            s << "step budget (" << max_steps << ") exhausted at t = " << t;
            throw integration_error(s.str());
        }
    }
};

//---------------------------------------------------------------------------
void record_failure(batch_report &stats, long k, const char *what) {
#pragma omp critical(basins_batch_report)
    {
        if (stats.failed == 0 || static_cast<size_t>(k) < stats.first_failed) {
            stats.first_failed = k;
            stats.first_error  = what;
        }
        ++stats.failed;
    }
}

} // namespace

//---------------------------------------------------------------------------
int default_workers() {
    return omp_get_num_procs();
}

//---------------------------------------------------------------------------
void check_solver_options(const solver_options &opt, double tmax) {
    if (!std::isfinite(tmax) || !(tmax > 0))
        throw configuration_error("integration horizon must be positive");

    if (!std::isfinite(opt.dt) || !(opt.dt > 0))
        throw configuration_error("initial time step must be positive");

    if (!(opt.abs_tol > 0) || !(opt.rel_tol > 0))
        throw configuration_error("error tolerances must be positive");

    if (opt.max_steps == 0)
        throw configuration_error("step budget must be positive");

    if (opt.workers < 0)
        throw configuration_error("worker count can not be negative");
}

//---------------------------------------------------------------------------
state_type integrate_terminal(
        const vector_field &f, const parameter_type &p,
        state_type x, double tmax, const solver_options &opt
        )
{
    typedef odeint::runge_kutta_dopri5<state_type> error_stepper_type;

    bound_system sys(f, p);
    step_guard   guard(opt.max_steps);

    odeint::integrate_adaptive(
            odeint::make_controlled<error_stepper_type>(opt.abs_tol, opt.rel_tol),
            std::ref(sys), x, 0.0, tmax, std::min(opt.dt, tmax), std::ref(guard)
            );

    return x;
}

//---------------------------------------------------------------------------
std::vector<trajectory_outcome> integrate_batch(
        const vector_field &f, const parameter_type &p,
        const std::vector<state_type> &u0, double tmax,
        const solver_options &opt, batch_report *report
        )
{
    if (!f) throw configuration_error("vector field is empty");
    check_solver_options(opt, tmax);

    const long n = static_cast<long>(u0.size());
    const int  workers = opt.workers > 0 ? opt.workers : default_workers();

    std::vector<trajectory_outcome> terminal(u0.size());
    batch_report stats;

#pragma omp parallel for schedule(dynamic) num_threads(workers)
    for(long k = 0; k < n; ++k) {
        try {
            terminal[k] = integrate_terminal(f, p, u0[k], tmax, opt);
        } catch(const std::exception &e) {
            record_failure(stats, k, e.what());
        } catch(...) {
            record_failure(stats, k, "unknown exception");
        }
    }

    if (report) *report = stats;

    return terminal;
}

} // namespace basins
