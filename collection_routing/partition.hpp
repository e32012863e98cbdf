#pragma once
#include <vector>
#include "config.hpp"
#include "model.hpp"

std::vector<Vehicle> select_active_vehicles(const std::vector<Vehicle> &vehicles);

// Lloyd's k-means with k-means++ seeding, best of opts.kmeans_restarts by
// inertia. Same input and seed give the same labels.
std::vector<int> kmeans_labels(const std::vector<Projected> &pts, int k, const Options &opts);

// One cluster per active vehicle, k = min(vehicles, points). Cluster ids are
// ordered by the first demand point each one contains; cluster i belongs to
// active[i]. Throws InputError on empty demand, an empty fleet, or repeated
// demand or vehicle ids.
std::vector<Cluster> partition_demand(const std::vector<DemandPoint> &demand,
                                      const std::vector<Vehicle> &active,
                                      const Options &opts);
