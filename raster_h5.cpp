#include <stdexcept>

#include <H5Cpp.h>

#include "raster_h5.hpp"

namespace basins {

//---------------------------------------------------------------------------
void save_raster(const std::string &fname, const raster &r, const basin_metadata &meta) {
    using namespace H5;

    H5File hdf(fname, H5F_ACC_TRUNC);

    hsize_t dim[] = {
        static_cast<hsize_t>(r.nx),
        static_cast<hsize_t>(r.ny)
    };

    hsize_t one[] = { 1 };
    DataSpace adsp(1, one);

    DataSet ds = hdf.createDataSet("/L", PredType::NATIVE_INT, DataSpace(2, dim));
    ds.write(r.labels.data(), PredType::NATIVE_INT);

    int xnum  = static_cast<int>(r.nx);
    int ynum  = static_cast<int>(r.ny);
    int nattr = static_cast<int>(meta.attractors.size());

#define CREATE_ATTRIBUTE(name, val, type) \
    ds.createAttribute(#name, type, adsp).write(type, &val)

    CREATE_ATTRIBUTE(xmin,    meta.bounds.xmin, PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(xmax,    meta.bounds.xmax, PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(ymin,    meta.bounds.ymin, PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(ymax,    meta.bounds.ymax, PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(delta,   meta.delta,       PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(tmax,    meta.tmax,        PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(maxdist, meta.maxdist,     PredType::NATIVE_DOUBLE);
    CREATE_ATTRIBUTE(xnum,    xnum,             PredType::NATIVE_INT32);
    CREATE_ATTRIBUTE(ynum,    ynum,             PredType::NATIVE_INT32);
    CREATE_ATTRIBUTE(nattr,   nattr,            PredType::NATIVE_INT32);

#undef CREATE_ATTRIBUTE

    StrType stype(PredType::C_S1, meta.model.empty() ? 1 : meta.model.size());
    ds.createAttribute("model", stype, DataSpace(H5S_SCALAR)).write(stype, meta.model);

    if (!meta.params.empty()) {
        hsize_t np[] = { static_cast<hsize_t>(meta.params.size()) };
        ds.createAttribute("params", PredType::NATIVE_DOUBLE, DataSpace(1, np))
            .write(PredType::NATIVE_DOUBLE, meta.params.data());
    }

    if (!meta.attractors.empty()) {
        std::vector<double> xy;
        xy.reserve(2 * meta.attractors.size());
        for(const point &a : meta.attractors) {
            xy.push_back(a[0]);
            xy.push_back(a[1]);
        }

        hsize_t na[] = { static_cast<hsize_t>(meta.attractors.size()), 2 };
        ds.createAttribute("attractors", PredType::NATIVE_DOUBLE, DataSpace(2, na))
            .write(PredType::NATIVE_DOUBLE, xy.data());
    }
}

//---------------------------------------------------------------------------
raster load_raster(const std::string &fname) {
    using namespace H5;

    H5File  hdf(fname, H5F_ACC_RDONLY);
    DataSet ds = hdf.openDataSet("/L");

    DataSpace space = ds.getSpace();
    if (space.getSimpleExtentNdims() != 2)
        throw std::runtime_error(fname + ": /L is not a two dimensional dataset");

    hsize_t dim[2];
    space.getSimpleExtentDims(dim);

    raster r(dim[0], dim[1]);
    ds.read(r.labels.data(), PredType::NATIVE_INT);

    return r;
}

} // namespace basins
