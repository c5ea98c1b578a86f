#ifndef MODELS_HPP
#define MODELS_HPP

#include <cmath>
#include <string>
#include <vector>

#include "common.hpp"

namespace basins {

//---------------------------------------------------------------------------
// Unforced Duffing oscillator with a double well potential.
//   x'' + gamma x' - x (beta - x^2) = 0
// For beta > 0 the stable equilibria are (+-sqrt(beta), 0).
//---------------------------------------------------------------------------
template <class State, class Parameter>
struct duffing_system {
    const Parameter &gamma;
    const Parameter &beta;

    duffing_system(const Parameter &gamma, const Parameter &beta)
        : gamma(gamma), beta(beta)
    {}

    void operator()(const State &x, State &dxdt, double /*t*/) const {
        dxdt[0] = x[1];
        dxdt[1] = -gamma * x[1] + x[0] * (beta - x[0] * x[0]);
    }
};

//---------------------------------------------------------------------------
// Periodically forced Duffing oscillator. The forcing phase is carried as
// the third state variable so the flow is autonomous.
//---------------------------------------------------------------------------
template <class State, class Parameter>
struct duffing_forced_system {
    const Parameter &gamma;
    const Parameter &beta;
    const Parameter &A;
    const Parameter &omega;

    duffing_forced_system(
            const Parameter &gamma, const Parameter &beta,
            const Parameter &A, const Parameter &omega
            )
        : gamma(gamma), beta(beta), A(A), omega(omega)
    {}

    void operator()(const State &x, State &dxdt, double /*t*/) const {
        using std::cos;
        dxdt[0] = x[1];
        dxdt[1] = -gamma * x[1] + x[0] * (beta - x[0] * x[0]) + A * cos(x[2]);
        dxdt[2] = omega;
    }
};

//---------------------------------------------------------------------------
// Forced van der Pol oscillator, phase as third variable.
//---------------------------------------------------------------------------
template <class State, class Parameter>
struct vdp_forced_system {
    const Parameter &mu;
    const Parameter &A;
    const Parameter &omega;

    vdp_forced_system(const Parameter &mu, const Parameter &A, const Parameter &omega)
        : mu(mu), A(A), omega(omega)
    {}

    void operator()(const State &x, State &dxdt, double /*t*/) const {
        using std::cos;
        dxdt[0] = x[1];
        dxdt[1] = mu * (1.0 - x[0] * x[0]) * x[1] - x[0] + A * cos(x[2]);
        dxdt[2] = omega;
    }
};

//---------------------------------------------------------------------------
// Built-in model registry used by the command line tools.
//---------------------------------------------------------------------------
struct model_info {
    std::string name;
    unsigned    dim;      // state dimension
    std::string params;   // parameter names, in order
    unsigned    nparams;
    parameter_type defaults;  // used when no parameters are given
};

const std::vector<model_info>& models();

// Throws configuration_error for an unknown name.
const model_info& find_model(const std::string &name);

// Returns the model's vector field. The parameter vector is checked against
// the model here, so a bad count is reported before any integration; the
// field must later be called with a vector of the same length.
vector_field make_vector_field(const std::string &name, const parameter_type &p);

} // namespace basins

#endif
