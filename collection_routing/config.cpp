#include "config.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

Options options_from_json(const json &j) {
    Options o;
    o.seed = j.value("seed", o.seed);
    o.kmeans_restarts = j.value("kmeans_restarts", o.kmeans_restarts);
    o.kmeans_max_iterations = j.value("kmeans_max_iterations", o.kmeans_max_iterations);
    o.meters_per_degree = j.value("meters_per_degree", o.meters_per_degree);
    o.node_precision = j.value("node_precision", o.node_precision);
    o.default_capacity = j.value("default_capacity", o.default_capacity);
    o.ward_no = j.value("ward_no", o.ward_no);

    if (j.contains("active_statuses")) {
        o.active_statuses.clear();
        for (const auto &s : j["active_statuses"])
            o.active_statuses.push_back(s.get<std::string>());
    }

    if (o.kmeans_restarts < 1) o.kmeans_restarts = 1;
    if (o.kmeans_max_iterations < 1) o.kmeans_max_iterations = 1;
    if (o.node_precision < 0) o.node_precision = 0.0;
    return o;
}

bool load_options(const std::string &filename, Options &opts)
{
    std::ifstream fin(filename);
    if (!fin) {
        std::cerr << "Could not open config file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
        opts = options_from_json(j);
    } catch (const std::exception &e) {
        std::cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }
    return true;
}
