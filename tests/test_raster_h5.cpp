#include <cstdio>
#include <string>

#include <catch2/catch.hpp>

#include <H5Cpp.h>

#include "raster_h5.hpp"

using namespace basins;

TEST_CASE("raster and run description go to HDF5", "[h5]") {
    const std::string fname = "test_raster_h5.h5";

    raster m(3, 2);
    m(0, 1) = 1;
    m(1, 0) = 2;
    m(2, 1) = 7;

    basin_metadata meta;
    meta.model   = "duffing";
    meta.bounds  = region{-1.0, 1.0, 0.0, 1.0};
    meta.delta   = 1.0;
    meta.tmax    = 30.0;
    meta.maxdist = 0.25;
    meta.params  = {0.7, 0.7};

    point a = {{0.5, -0.5}};
    meta.attractors.push_back(a);

    save_raster(fname, m, meta);

    raster back = load_raster(fname);
    REQUIRE(back.nx == 3);
    REQUIRE(back.ny == 2);
    CHECK(back.labels == m.labels);

    {
        H5::H5File hdf(fname, H5F_ACC_RDONLY);
        H5::DataSet ds = hdf.openDataSet("/L");

        double maxdist = 0;
        ds.openAttribute("maxdist").read(H5::PredType::NATIVE_DOUBLE, &maxdist);
        CHECK(maxdist == 0.25);

        int nattr = 0;
        ds.openAttribute("nattr").read(H5::PredType::NATIVE_INT32, &nattr);
        CHECK(nattr == 1);

        double xy[2] = {0, 0};
        ds.openAttribute("attractors").read(H5::PredType::NATIVE_DOUBLE, xy);
        CHECK(xy[0] ==  0.5);
        CHECK(xy[1] == -0.5);
    }

    std::remove(fname.c_str());
}
