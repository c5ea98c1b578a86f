#include <sstream>
#include <algorithm>

#include "models.hpp"

namespace basins {

//---------------------------------------------------------------------------
const std::vector<model_info>& models() {
    static const std::vector<model_info> m = {
        {"zero",           2, "",                   0, {}},
        {"duffing",        2, "gamma beta",         2, {0.7, 0.7}},
        {"duffing_forced", 3, "gamma beta A omega", 4, {0.14, 1.0, 0.1, 1.0}},
        {"vdp_forced",     3, "mu A omega",         3, {0.1, 0.0, 1.0}},
    };
    return m;
}

//---------------------------------------------------------------------------
const model_info& find_model(const std::string &name) {
    const std::vector<model_info> &m = models();

    auto i = std::find_if(m.begin(), m.end(),
            [&name](const model_info &info) { return info.name == name; });

    if (i == m.end()) {
        std::ostringstream s;
        s << "unknown model \"" << name << "\" (available:";
        for(const model_info &info : m) s << " " << info.name;
        s << ")";
        throw configuration_error(s.str());
    }

    return *i;
}

//---------------------------------------------------------------------------
vector_field make_vector_field(const std::string &name, const parameter_type &p) {
    const model_info &info = find_model(name);

    if (p.size() != info.nparams) {
        std::ostringstream s;
        s << "model " << info.name << " takes " << info.nparams
          << " parameters (" << info.params << "), got " << p.size();
        throw configuration_error(s.str());
    }

    if (info.name == "duffing") {
        return [](const state_type &x, state_type &dxdt, const parameter_type &p, double t) {
            duffing_system<state_type, double> sys(p[0], p[1]);
            sys(x, dxdt, t);
        };
    }

    if (info.name == "duffing_forced") {
        return [](const state_type &x, state_type &dxdt, const parameter_type &p, double t) {
            duffing_forced_system<state_type, double> sys(p[0], p[1], p[2], p[3]);
            sys(x, dxdt, t);
        };
    }

    if (info.name == "vdp_forced") {
        return [](const state_type &x, state_type &dxdt, const parameter_type &p, double t) {
            vdp_forced_system<state_type, double> sys(p[0], p[1], p[2]);
            sys(x, dxdt, t);
        };
    }

    return [](const state_type&, state_type &dxdt, const parameter_type&, double) {
        std::fill(dxdt.begin(), dxdt.end(), 0.0);
    };
}

} // namespace basins
