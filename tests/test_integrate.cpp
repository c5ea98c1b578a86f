#include <cmath>
#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include <boost/numeric/odeint.hpp>

#include "integrate.hpp"

namespace Catch {
template<>
struct StringMaker<basins::trajectory_outcome> {
    static std::string convert(const basins::trajectory_outcome &v) {
        return v ? ::Catch::Detail::stringify(*v) : std::string("none");
    }
};
} // namespace Catch

using namespace basins;

namespace {

void decay(const state_type &x, state_type &dxdt, const parameter_type &p, double) {
    for(size_t k = 0; k < x.size(); ++k) dxdt[k] = -p[0] * x[k];
}

void still(const state_type&, state_type &dxdt, const parameter_type&, double) {
    for(double &v : dxdt) v = 0;
}

} // namespace

TEST_CASE("terminal state of a linear decay", "[integrate]") {
    parameter_type p = {0.5};
    state_type x = {1.0, -2.0, 0.0};

    state_type u = integrate_terminal(decay, p, x, 4.0);

    REQUIRE(u.size() == 3);
    CHECK(u[0] == Approx( 1.0 * std::exp(-2.0)).epsilon(1e-5));
    CHECK(u[1] == Approx(-2.0 * std::exp(-2.0)).epsilon(1e-5));
    CHECK(u[2] == 0.0);
}

TEST_CASE("zero field leaves every state in place", "[integrate]") {
    std::vector<state_type> u0 = {{0.0, 0.0}, {1.5, -0.5}, {-3.0, 2.0}};

    std::vector<trajectory_outcome> terminal = integrate_batch(still, parameter_type(), u0, 100.0);

    REQUIRE(terminal.size() == u0.size());
    for(size_t k = 0; k < u0.size(); ++k) {
        REQUIRE(terminal[k]);
        CHECK(*terminal[k] == u0[k]);
    }
}

TEST_CASE("a throwing trajectory fails alone", "[integrate]") {
    vector_field f = [](const state_type &x, state_type &dxdt, const parameter_type&, double) {
        if (x[0] == 1.0 && x[1] == 1.0) throw std::runtime_error("singular point");
        dxdt[0] = -x[0];
        dxdt[1] = -x[1];
    };

    std::vector<state_type> u0 = {{0.5, 0.5}, {1.0, 1.0}, {-1.0, 0.25}, {2.0, 2.0}};

    solver_options opt;
    opt.workers = 3;

    batch_report report;
    std::vector<trajectory_outcome> terminal = integrate_batch(f, parameter_type(), u0, 1.0, opt, &report);

    REQUIRE(terminal.size() == 4);
    CHECK( terminal[0]);
    CHECK(!terminal[1]);
    CHECK( terminal[2]);
    CHECK( terminal[3]);

    CHECK(report.failed == 1);
    CHECK(report.first_failed == 1);
    CHECK(report.first_error == "singular point");

    CHECK((*terminal[2])[0] == Approx(-std::exp(-1.0)).epsilon(1e-5));
}

TEST_CASE("exceptions of any type fail only their trajectory", "[integrate]") {
    vector_field f = [](const state_type &x, state_type &dxdt, const parameter_type&, double) {
        if (x[0] == 1.0) throw 42;
        dxdt[0] = -x[0];
        dxdt[1] = -x[1];
    };

    std::vector<state_type> u0 = {{0.5, 0.5}, {1.0, 0.0}, {-1.0, 0.25}};

    solver_options opt;
    opt.workers = 2;

    batch_report report;
    std::vector<trajectory_outcome> terminal = integrate_batch(f, parameter_type(), u0, 1.0, opt, &report);

    REQUIRE(terminal.size() == 3);
    CHECK( terminal[0]);
    CHECK(!terminal[1]);
    CHECK( terminal[2]);

    CHECK(report.failed == 1);
    CHECK(report.first_failed == 1);
    CHECK(report.first_error == "unknown exception");
}

TEST_CASE("blow up is reported as a failure", "[integrate]") {
    // x' = x^2 reaches infinity at t = 1 / x0.
    vector_field f = [](const state_type &x, state_type &dxdt, const parameter_type&, double) {
        dxdt[0] = x[0] * x[0];
        dxdt[1] = 0;
    };

    std::vector<state_type> u0 = {{-1.0, 0.0}, {1.0, 0.0}};

    solver_options opt;
    opt.max_steps = 10000;

    batch_report report;
    std::vector<trajectory_outcome> terminal = integrate_batch(f, parameter_type(), u0, 5.0, opt, &report);

    REQUIRE(terminal[0]);
    CHECK((*terminal[0])[0] == Approx(-1.0 / 6.0).epsilon(1e-4));
    CHECK(!terminal[1]);
    CHECK(report.failed == 1);
}

TEST_CASE("step budget bounds a trajectory", "[integrate]") {
    parameter_type p = {0.5};
    state_type x = {1.0, 1.0};

    solver_options opt;
    opt.max_steps = 3;

    CHECK_THROWS_AS(integrate_terminal(decay, p, x, 1000.0, opt), integration_error);
}

TEST_CASE("step budget counts accepted steps", "[integrate]") {
    namespace odeint = boost::numeric::odeint;

    parameter_type p = {0.5};
    state_type x = {1.0, 1.0};
    const double tmax = 10.0;

    solver_options opt;

    // Steps odeint takes on its own with the same stepper and settings.
    state_type u = x;
    size_t n = odeint::integrate_adaptive(
            odeint::make_controlled<odeint::runge_kutta_dopri5<state_type> >(opt.abs_tol, opt.rel_tol),
            [&p](const state_type &x, state_type &dxdt, double t) { decay(x, dxdt, p, t); },
            u, 0.0, tmax, opt.dt);
    REQUIRE(n > 1);

    opt.max_steps = n;
    CHECK_NOTHROW(integrate_terminal(decay, p, x, tmax, opt));

    opt.max_steps = n - 1;
    CHECK_THROWS_AS(integrate_terminal(decay, p, x, tmax, opt), integration_error);
}

TEST_CASE("resizing the derivative is an integration failure", "[integrate]") {
    vector_field f = [](const state_type&, state_type &dxdt, const parameter_type&, double) {
        dxdt.assign(2, 0.0);
    };

    state_type x = {0.0, 0.0, 0.0};
    CHECK_THROWS_AS(integrate_terminal(f, parameter_type(), x, 1.0), integration_error);
}

TEST_CASE("batch result does not depend on the worker count", "[integrate]") {
    vector_field f = [](const state_type &x, state_type &dxdt, const parameter_type&, double) {
        dxdt[0] = x[1];
        dxdt[1] = -0.3 * x[1] + x[0] * (1.0 - x[0] * x[0]);
    };

    std::vector<state_type> u0;
    for(int i = 0; i < 40; ++i)
        u0.push_back(state_type{-2.0 + 0.1 * i, 0.5});

    solver_options one;
    one.workers = 1;

    solver_options many;
    many.workers = 4;

    std::vector<trajectory_outcome> a = integrate_batch(f, parameter_type(), u0, 20.0, one);
    std::vector<trajectory_outcome> b = integrate_batch(f, parameter_type(), u0, 20.0, many);

    REQUIRE(a.size() == b.size());
    for(size_t k = 0; k < a.size(); ++k) {
        REQUIRE(a[k]);
        REQUIRE(b[k]);
        CHECK(*a[k] == *b[k]);
    }
}

TEST_CASE("unusable solver setups are rejected", "[integrate]") {
    std::vector<state_type> u0 = {{0.0, 0.0}};

    CHECK_THROWS_AS(integrate_batch(vector_field(), parameter_type(), u0, 1.0), configuration_error);
    CHECK_THROWS_AS(integrate_batch(still, parameter_type(), u0, 0.0), configuration_error);
    CHECK_THROWS_AS(integrate_batch(still, parameter_type(), u0, -1.0), configuration_error);

    solver_options opt;
    opt.dt = 0;
    CHECK_THROWS_AS(integrate_batch(still, parameter_type(), u0, 1.0, opt), configuration_error);

    opt = solver_options();
    opt.workers = -2;
    CHECK_THROWS_AS(integrate_batch(still, parameter_type(), u0, 1.0, opt), configuration_error);
}
