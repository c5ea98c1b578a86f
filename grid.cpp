#include <cmath>
#include <sstream>

#include "grid.hpp"

namespace basins {

namespace {

// Relative slack for (hi - lo) / delta landing just below an integer.
const double step_tolerance = 1e-10;

void check_axis(const char *name, double lo, double hi) {
    if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi) {
        std::ostringstream s;
        s << "invalid " << name << " range [" << lo << ", " << hi << "]";
        throw configuration_error(s.str());
    }
}

} // namespace

//---------------------------------------------------------------------------
size_t axis_size(double lo, double hi, double delta) {
    double steps = (hi - lo) / delta;
    return static_cast<size_t>(std::floor(steps + step_tolerance * (1 + steps))) + 1;
}

//---------------------------------------------------------------------------
std::vector<double> axis(double lo, double hi, double delta) {
    size_t n = axis_size(lo, hi, delta);

    std::vector<double> v(n);
    for(size_t i = 0; i < n; ++i)
        v[i] = lo + i * delta;

    return v;
}

//---------------------------------------------------------------------------
grid make_grid(const region &r, double delta) {
    if (!std::isfinite(delta) || !(delta > 0)) {
        std::ostringstream s;
        s << "grid spacing must be positive, got " << delta;
        throw configuration_error(s.str());
    }

    check_axis("x", r.xmin, r.xmax);
    check_axis("y", r.ymin, r.ymax);

    grid g;
    g.x = axis(r.xmin, r.xmax, delta);
    g.y = axis(r.ymin, r.ymax, delta);
    return g;
}

//---------------------------------------------------------------------------
std::vector<state_type> initial_states(const grid &g, unsigned dim) {
    if (dim < 2)
        throw configuration_error("state dimension must be at least 2");

    std::vector<state_type> u0;
    u0.reserve(g.size());

    for(size_t i = 0; i < g.nx(); ++i) {
        for(size_t j = 0; j < g.ny(); ++j) {
            state_type x(dim, 0.0);
            x[0] = g.x[i];
            x[1] = g.y[j];
            u0.push_back(x);
        }
    }

    return u0;
}

} // namespace basins
