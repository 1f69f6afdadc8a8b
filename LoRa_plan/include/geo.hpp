/*
  File: include/geo.hpp

  Great-circle distance between two geographic coordinates.

  Used in:
    - feasibility.cpp (gateway and node-to-node link ranges)
    - planner.cpp (evaluate_single_node_eligibility)
*/
#pragma once

#include "common.hpp"

namespace lplan {

    /*
      distance_km(a, b)

      Haversine distance on a sphere of radius EARTH_RADIUS_KM.

      Properties relied upon by the graph builder:
        - symmetric: distance_km(a,b) == distance_km(b,a)
        - distance_km(a,a) == 0
        - result >= 0 for finite inputs (NaN in, NaN out)
    */
    double distance_km(const Coordinate& a, const Coordinate& b);

    double deg_to_rad(double deg);
}
