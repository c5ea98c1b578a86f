#include <ostream>
#include <sstream>
#include <stdexcept>

#include "raster.hpp"

namespace basins {

//---------------------------------------------------------------------------
raster assemble_raster(const grid &g, const std::vector<int> &labels) {
    if (labels.size() != g.size()) {
        std::ostringstream s;
        s << "got " << labels.size() << " labels for a grid of "
          << g.nx() << "x" << g.ny() << " points";
        throw std::length_error(s.str());
    }

    raster r(g.nx(), g.ny());

    for(size_t i = 0; i < g.nx(); ++i)
        for(size_t j = 0; j < g.ny(); ++j)
            r(i, j) = labels[g.index(i, j)];

    return r;
}

//---------------------------------------------------------------------------
void clear_corner(raster &r) {
    if (!r.labels.empty()) r(0, 0) = 0;
}

//---------------------------------------------------------------------------
std::vector<size_t> label_counts(const raster &r, int nlabels) {
    std::vector<size_t> count(nlabels + 1, 0);

    for(int l : r.labels)
        if (l >= 0 && l <= nlabels) ++count[l];

    return count;
}

//---------------------------------------------------------------------------
void write_text(std::ostream &os, const raster &r) {
    for(size_t i = 0; i < r.nx; ++i) {
        for(size_t j = 0; j < r.ny; ++j) {
            if (j) os << " ";
            os << r(i, j);
        }
        os << "\n";
    }
}

} // namespace basins
