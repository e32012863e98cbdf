#pragma once
#include <vector>
#include "model.hpp"

// Everything the pipeline produced for one active vehicle.
struct VehiclePlan {
    Vehicle vehicle;
    std::vector<Trip> trips;
    bool capacity_rejected = false;
    std::vector<int> dropped_ids;   // cluster members of a rejected vehicle
};

OptimizationResult aggregate_assignments(const std::vector<VehiclePlan> &plans,
                                         const std::vector<Cluster> &clusters);
