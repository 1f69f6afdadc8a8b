// Synthetic network definition generator for planner scaling runs.
#include "plan_io.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

struct GridLayout {
    int cols = 0;
    int rows = 0;
};

static GridLayout square_layout(int n)
{
    GridLayout g;
    if (n < 1) return g;
    g.cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
    g.rows = (n + g.cols - 1) / g.cols;
    return g;
}

static void usage()
{
    std::cerr << "Usage: net_gen out.def N [spacing_km] [seed]\n";
}

int main(int argc, char** argv)
{
    if (argc < 3) {
        usage();
        return 1;
    }

    const std::string out_path = argv[1];
    const int n = std::atoi(argv[2]);
    double spacing_km = 3.0;
    unsigned seed = 1;
    if (argc >= 4) spacing_km = std::atof(argv[3]);
    if (argc >= 5) seed = static_cast<unsigned>(std::strtoul(argv[4], nullptr, 10));

    if (n < 1 || !(spacing_km > 0.0)) {
        std::cerr << "Invalid node count or spacing\n";
        return 1;
    }

    // gateway sits at the grid centre; 1 deg latitude ~ 111.2 km
    const double gw_lat = 40.7128;
    const double gw_lon = -74.0060;
    const double km_per_deg_lat = 111.195;
    const double km_per_deg_lon = km_per_deg_lat * std::cos(gw_lat * M_PI / 180.0);

    GridLayout g = square_layout(n);
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> jitter(-0.25 * spacing_km, 0.25 * spacing_km);

    std::ofstream out(out_path, std::ios::trunc);
    if (!out) {
        std::cerr << "Could not open " << out_path << '\n';
        return 1;
    }

    out << "# net_gen N=" << n << " spacing=" << spacing_km << "km seed=" << seed << '\n';
    out.precision(10);
    out << "gateway " << gw_lat << ' ' << gw_lon << '\n';

    int written = 0;
    for (int r = 0; r < g.rows && written < n; ++r) {
        for (int c = 0; c < g.cols && written < n; ++c) {
            const double east_km  = (c - (g.cols - 1) / 2.0) * spacing_km + jitter(gen);
            const double north_km = (r - (g.rows - 1) / 2.0) * spacing_km + jitter(gen);

            lplan::RelayNode node;
            node.id = "N" + std::to_string(++written);
            node.position.lat = gw_lat + north_km / km_per_deg_lat;
            node.position.lon = gw_lon + east_km / km_per_deg_lon;
            node.direct_to_gateway = std::hypot(east_km, north_km) <= 5.0;

            out << lplan::io::format_network_line(node) << '\n';
        }
    }

    std::cout << "Wrote " << written << " node(s) to " << out_path << '\n';
    return 0;
}
