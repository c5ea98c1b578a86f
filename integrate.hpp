#ifndef INTEGRATE_HPP
#define INTEGRATE_HPP

#include <vector>
#include <string>
#include <cstddef>
#include <stdexcept>

#include <boost/optional.hpp>

#include "common.hpp"

namespace basins {

struct solver_options {
    double dt;          // initial step
    double abs_tol;
    double rel_tol;
    size_t max_steps;   // accepted steps allowed before giving up
    int    workers;     // 0 means one per processor

    solver_options()
        : dt(0.01), abs_tol(1e-6), rel_tol(1e-6), max_steps(100000), workers(0)
    {}
};

// A single trajectory did not reach tmax.
struct integration_error : public std::runtime_error {
    explicit integration_error(const std::string &what)
        : std::runtime_error(what) {}
};

// Terminal state, or none when the trajectory failed.
typedef boost::optional<state_type> trajectory_outcome;

struct batch_report {
    size_t      failed;
    size_t      first_failed;   // index of the first failed trajectory
    std::string first_error;

    batch_report() : failed(0), first_failed(0) {}
};

int default_workers();

// Throws configuration_error for an unusable solver setup.
void check_solver_options(const solver_options &opt, double tmax);

// Integrates x from t = 0 to tmax and returns the state at tmax.
// Any failure is thrown (integration_error, odeint errors or whatever the
// vector field throws).
state_type integrate_terminal(
        const vector_field &f, const parameter_type &p,
        state_type x, double tmax, const solver_options &opt = solver_options()
        );

// Integrates every initial state to tmax on opt.workers threads. The
// result keeps the order of u0. Failed trajectories come back as none and
// never abort the batch.
std::vector<trajectory_outcome> integrate_batch(
        const vector_field &f, const parameter_type &p,
        const std::vector<state_type> &u0, double tmax,
        const solver_options &opt = solver_options(),
        batch_report *report = 0
        );

} // namespace basins

#endif
