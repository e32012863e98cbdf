#pragma once
#include <vector>
#include "cluster_roads.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "nlohmann/json.hpp"

nlohmann::json result_to_json(const OptimizationResult &res, const Options &opts);
nlohmann::json cluster_roads_to_json(const ClusterRoads &cr);
nlohmann::json all_cluster_roads_to_json(const std::vector<ClusterRoads> &all);
nlohmann::json failure_to_json(const InputError &e);
