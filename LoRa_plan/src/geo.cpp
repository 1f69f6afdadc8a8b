/*─────────────────────────────────────────────────────────────
  geo.cpp  –  haversine great-circle distance
─────────────────────────────────────────────────────────────*/
#include "geo.hpp"

#include <cmath>

namespace lplan {

double deg_to_rad(double deg)
{
    return deg * M_PI / 180.0;
}

double distance_km(const Coordinate& a, const Coordinate& b)
{
    const double lat1 = deg_to_rad(a.lat);
    const double lat2 = deg_to_rad(b.lat);
    const double dlat = lat2 - lat1;
    const double dlon = deg_to_rad(b.lon) - deg_to_rad(a.lon);

    const double s_lat = std::sin(dlat / 2.0);
    const double s_lon = std::sin(dlon / 2.0);
    double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;

    // rounding can push h marginally past 1 for antipodal points
    if (h > 1.0) h = 1.0;

    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return EARTH_RADIUS_KM * c;
}

} // namespace lplan
