#pragma once
#include <vector>
#include "snapper.hpp"

struct Stop {
    int demand_id;
    SnapResult snap;
};

// Greedy nearest neighbour from the first stop, measured between snapped
// positions. Ties go to the earliest remaining stop.
std::vector<Stop> sequence_stops(const std::vector<Stop> &stops);
