#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

#include "common.hpp"

namespace config {

extern std::string conf;
extern std::string out;
extern std::string txt;

extern std::string         model;
extern std::vector<double> param;   // model defaults unless given

extern std::vector<std::string> attractor;
extern double maxdist;

extern double xmin;
extern double xmax;
extern double ymin;
extern double ymax;
extern double delta;

extern double x0;
extern double y0;

extern double dt;
extern double tmax;
extern double abs_tol;
extern double rel_tol;
extern int    max_steps;
extern int    workers;
extern bool   clear_corner;

// Parses the command line, then the configuration file named by conf.
// Options given on the command line take precedence.
void read(int argc, char *argv[]);

// Parses "x,y". Throws basins::configuration_error on anything else.
basins::point parse_point(const std::string &s);

// The attractor options, parsed.
std::vector<basins::point> attractors();

}

#endif
