#pragma once
#include "graph.hpp"

struct SnapResult {
    int node;          // -1 when the graph has no nodes
    Coord coord;
    double distance;
    bool snapped;
};

// Linear scan over graph nodes; ties go to the lowest node id.
SnapResult snap_to_road(const RoadGraph &g, const Coord &pt);
