#ifndef COMMON_HPP
#define COMMON_HPP

#include <vector>
#include <string>
#include <stdexcept>
#include <functional>

#include <boost/array.hpp>

namespace basins {

typedef std::vector<double>     state_type;
typedef std::vector<double>     parameter_type;
typedef boost::array<double, 2> point;

// Right hand side of the flow: dxdt = f(x, p, t).
// dxdt arrives sized to x and must keep that size.
typedef std::function<
    void(const state_type &x, state_type &dxdt, const parameter_type &p, double t)
    > vector_field;

// Labels 1..max_attractors belong to attractors, 0 is unclassified.
const int max_attractors = 7;

// Bad run setup. Thrown before any trajectory is integrated.
struct configuration_error : public std::logic_error {
    explicit configuration_error(const std::string &what)
        : std::logic_error(what) {}
};

} // namespace basins

#endif
