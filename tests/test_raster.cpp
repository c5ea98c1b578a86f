#include <sstream>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "raster.hpp"

using namespace basins;

TEST_CASE("raster entry (i, j) belongs to grid point (x[i], y[j])", "[raster]") {
    region r = {0.0, 2.0, 0.0, 1.0};
    grid g = make_grid(r, 1.0);

    REQUIRE(g.nx() == 3);
    REQUIRE(g.ny() == 2);

    std::vector<int> labels(g.size());
    for(size_t i = 0; i < g.nx(); ++i)
        for(size_t j = 0; j < g.ny(); ++j)
            labels[g.index(i, j)] = static_cast<int>(10 * i + j);

    raster m = assemble_raster(g, labels);

    REQUIRE(m.nx == 3);
    REQUIRE(m.ny == 2);
    for(size_t i = 0; i < m.nx; ++i)
        for(size_t j = 0; j < m.ny; ++j)
            CHECK(m(i, j) == static_cast<int>(10 * i + j));
}

TEST_CASE("label count must match the grid", "[raster]") {
    region r = {0.0, 1.0, 0.0, 1.0};
    grid g = make_grid(r, 1.0);

    CHECK_THROWS_AS(assemble_raster(g, std::vector<int>(3, 0)), std::length_error);
}

TEST_CASE("corner override touches only entry (0, 0)", "[raster]") {
    raster m(2, 3);
    for(int &l : m.labels) l = 2;

    clear_corner(m);

    CHECK(m(0, 0) == 0);
    CHECK(m(0, 1) == 2);
    CHECK(m(1, 0) == 2);
    CHECK(m(1, 2) == 2);

    raster empty;
    CHECK_NOTHROW(clear_corner(empty));
}

TEST_CASE("label histogram", "[raster]") {
    raster m(2, 2);
    m(0, 0) = 0;
    m(0, 1) = 1;
    m(1, 0) = 1;
    m(1, 1) = 3;

    std::vector<size_t> count = label_counts(m, 3);

    REQUIRE(count.size() == 4);
    CHECK(count[0] == 1);
    CHECK(count[1] == 2);
    CHECK(count[2] == 0);
    CHECK(count[3] == 1);
}

TEST_CASE("text output has one line per x sample", "[raster]") {
    raster m(2, 3);
    m(0, 2) = 1;
    m(1, 0) = 2;

    std::ostringstream s;
    write_text(s, m);

    CHECK(s.str() == "0 0 1\n2 0 0\n");
}
