#pragma once
#include <vector>
#include "sequencer.hpp"

struct SPResult {
    bool possible;
    double cost;
    std::vector<int> path;
};

SPResult dijkstra(const RoadGraph &g, int source, int target);

struct StitchedRoute {
    std::vector<Coord> nodes;
    int degraded_segments = 0;
    double length = 0.0;
};

// Joins consecutive stops by shortest road paths. A pair with no road path
// (or an unsnapped end) gets a straight segment and counts as degraded.
StitchedRoute stitch_route(const RoadGraph &g, const std::vector<Stop> &ordered);
