#pragma once
#include <vector>
#include "config.hpp"
#include "graph.hpp"
#include "model.hpp"

// Partition, segment, snap, sequence and stitch over a prebuilt road graph.
// Throws InputError when there is no demand or no active vehicle; every other
// degradation is recorded in the result.
OptimizationResult optimize_routes(const RoadGraph &g,
                                   const std::vector<DemandPoint> &demand,
                                   const std::vector<Vehicle> &vehicles,
                                   const Options &opts);

// Same, building the road graph from raw geometries first.
OptimizationResult optimize_routes(const std::vector<RoadGeometry> &roads,
                                   const std::vector<DemandPoint> &demand,
                                   const std::vector<Vehicle> &vehicles,
                                   const Options &opts);
