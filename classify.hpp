#ifndef CLASSIFY_HPP
#define CLASSIFY_HPP

#include <vector>

#include "common.hpp"
#include "integrate.hpp"

namespace basins {

// Throws configuration_error when there are more than max_attractors
// attractors, an attractor is not finite, or maxdist is not a positive
// number.
void check_attractors(const std::vector<point> &attractors, double maxdist);

// Euclidean distance between the (x, y) projection of a state and a point.
double distance2d(const state_type &x, const point &a);

// Label of the first attractor (in list order) within maxdist of the state,
// or 0 when none is. The first match wins even if a later attractor is
// closer.
int classify(const state_type &x, const std::vector<point> &attractors, double maxdist);

// Failed trajectories are unclassified.
int classify(const trajectory_outcome &x, const std::vector<point> &attractors, double maxdist);

// Labels for a whole batch, in batch order.
std::vector<int> classify_batch(
        const std::vector<trajectory_outcome> &terminal,
        const std::vector<point> &attractors, double maxdist
        );

} // namespace basins

#endif
