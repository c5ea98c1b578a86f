#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdlib>
#include <boost/program_options.hpp>
#include "config.hpp"
#include "models.hpp"

namespace config {

std::string conf = "basins.cfg";
std::string out  = "basins.h5";
std::string txt  = "";

std::string         model = "duffing";
std::vector<double> param;

std::vector<std::string> attractor = {"0.83666,0", "-0.83666,0"};
double maxdist = 0.1;

double xmin  = -2.5;
double xmax  =  2.5;
double ymin  = -2.0;
double ymax  =  2.0;
double delta =  0.02;

double x0 = 0.5;
double y0 = 0.5;

double dt        = 0.01;
double tmax      = 1000.0;
double abs_tol   = 1e-6;
double rel_tol   = 1e-6;
int    max_steps = 100000;
int    workers   = 0;
bool   clear_corner = true;

template <typename T>
std::string to_string(const T &val) {
    std::ostringstream s;
    s << std::setprecision(3) << val;
    return s.str();
}

template <typename T>
std::string to_string(const std::vector<T> &val) {
    std::ostringstream s;
    s << std::setprecision(3);
    for(size_t i = 0; i < val.size(); ++i)
        s << (i ? " " : "") << val[i];
    return s.str();
}

void read(int argc, char *argv[]) {
    namespace po = boost::program_options;
    po::options_description desc("Options");

#define OPTION(name, descr)                                                    \
    (#name,                                                                    \
     po::value<decltype(name)>(&name)->default_value(name, to_string(name)),   \
     descr                                                                     \
    )

#define MULTI_OPTION(name, descr)                                              \
    (#name,                                                                    \
     po::value<decltype(name)>(&name)                                          \
        ->default_value(name, to_string(name))->multitoken(),                  \
     descr                                                                     \
    )

    desc.add_options()
        ("help,h", "Show help")
        OPTION(conf,         "Configuration file")
        OPTION(out,          "Output file (HDF5)")
        OPTION(txt,          "Text output file (optional)")
        OPTION(model,        "Vector field (zero, duffing, duffing_forced, vdp_forced)")
        ("param",
         po::value<decltype(param)>(&param)->multitoken(),
         "Model parameters, in order (use --param=-1 for negative values; "
         "model defaults when omitted)")
        MULTI_OPTION(attractor, "Attractor as x,y (at most 7, repeat for each; "
                                "use --attractor=-1,0 for negative x)")
        OPTION(maxdist,      "Distance to an attractor counted as converged")
        OPTION(xmin,         "Minimum X coordinate")
        OPTION(xmax,         "Maximum X coordinate")
        OPTION(ymin,         "Minimum Y coordinate")
        OPTION(ymax,         "Maximum Y coordinate")
        OPTION(delta,        "Grid spacing")
        OPTION(x0,           "Initial X coordinate (probe)")
        OPTION(y0,           "Initial Y coordinate (probe)")
        OPTION(dt,           "Initial time step")
        OPTION(tmax,         "Time limit")
        OPTION(abs_tol,      "Absolute error tolerance")
        OPTION(rel_tol,      "Relative error tolerance")
        OPTION(max_steps,    "Maximum number of steps per trajectory")
        OPTION(workers,      "Number of worker threads (0: one per processor)")
        OPTION(clear_corner, "Force the (xmin, ymin) cell to label 0")
        ;

#undef MULTI_OPTION
#undef OPTION

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        exit(0);
    }

    std::ifstream cfg(conf);
    if (cfg) {
        po::store(po::parse_config_file(cfg, desc), vm);
        po::notify(vm);
    }

    // The model supplies its own parameters when none are given.
    if (!vm.count("param"))
        param = basins::find_model(model).defaults;

    if (attractor.size() > static_cast<size_t>(basins::max_attractors))
        throw basins::configuration_error("too many attractors (maximum supported is 7)");

    if (max_steps <= 0)
        throw basins::configuration_error("max_steps must be positive");
}

basins::point parse_point(const std::string &s) {
    std::istringstream is(s);

    basins::point p;
    char sep = 0;
    std::string rest;

    if (!(is >> p[0] >> sep >> p[1]) || sep != ',' || (is >> rest))
        throw basins::configuration_error("bad point \"" + s + "\" (expected x,y)");

    return p;
}

std::vector<basins::point> attractors() {
    std::vector<basins::point> a;
    for(const std::string &s : attractor)
        a.push_back(parse_point(s));
    return a;
}

}
