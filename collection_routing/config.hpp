#pragma once
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

struct Options {
    unsigned seed = 42;
    int kmeans_restarts = 10;
    int kmeans_max_iterations = 300;
    double meters_per_degree = 111000.0;
    double node_precision = 1e-7;   // degrees; 0 = exact coordinate equality
    std::vector<std::string> active_statuses = {"active", "available", "online"};
    int default_capacity = 500;
    std::string ward_no;            // empty = no ward filter
};

Options options_from_json(const nlohmann::json &j);

bool load_options(const std::string &filename, Options &opts);
