#include <cmath>
#include <sstream>

#include "classify.hpp"

namespace basins {

//---------------------------------------------------------------------------
void check_attractors(const std::vector<point> &attractors, double maxdist) {
    if (attractors.size() > static_cast<size_t>(max_attractors)) {
        std::ostringstream s;
        s << "maximum number of attractors is " << max_attractors
          << ", got " << attractors.size();
        throw configuration_error(s.str());
    }

    for(size_t m = 0; m < attractors.size(); ++m) {
        if (!std::isfinite(attractors[m][0]) || !std::isfinite(attractors[m][1])) {
            std::ostringstream s;
            s << "attractor " << m + 1 << " is not finite";
            throw configuration_error(s.str());
        }
    }

    if (!std::isfinite(maxdist) || !(maxdist > 0)) {
        std::ostringstream s;
        s << "maxdist must be positive, got " << maxdist;
        throw configuration_error(s.str());
    }
}

//---------------------------------------------------------------------------
double distance2d(const state_type &x, const point &a) {
    double dx = x[0] - a[0];
    double dy = x[1] - a[1];
    return std::sqrt(dx * dx + dy * dy);
}

//---------------------------------------------------------------------------
int classify(const state_type &x, const std::vector<point> &attractors, double maxdist) {
    if (x.size() < 2) return 0;

    for(size_t m = 0; m < attractors.size(); ++m)
        if (distance2d(x, attractors[m]) <= maxdist) return static_cast<int>(m + 1);

    return 0;
}

//---------------------------------------------------------------------------
int classify(const trajectory_outcome &x, const std::vector<point> &attractors, double maxdist) {
    return x ? classify(*x, attractors, maxdist) : 0;
}

//---------------------------------------------------------------------------
std::vector<int> classify_batch(
        const std::vector<trajectory_outcome> &terminal,
        const std::vector<point> &attractors, double maxdist
        )
{
    std::vector<int> labels(terminal.size());

    for(size_t k = 0; k < terminal.size(); ++k)
        labels[k] = classify(terminal[k], attractors, maxdist);

    return labels;
}

} // namespace basins
