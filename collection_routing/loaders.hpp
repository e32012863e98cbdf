#pragma once
#include <istream>
#include <map>
#include <string>
#include <vector>
#include "config.hpp"
#include "model.hpp"
#include "nlohmann/json.hpp"

VehicleStatus parse_vehicle_status(const std::string &text,
                                   const std::vector<std::string> &active_statuses);

// Canonical vehicle field -> source key chosen for this document.
using FieldBinding = std::map<std::string, std::string>;

const int VEHICLE_SCHEMA_VERSION = 1;

FieldBinding resolve_vehicle_fields(const nlohmann::json &records);

std::vector<Vehicle> vehicles_from_json(const nlohmann::json &j, const Options &opts);
// Header row names the columns; cells go through the same field mapping as JSON records.
std::vector<Vehicle> vehicles_from_csv(std::istream &in, const Options &opts);
std::vector<RoadGeometry> roads_from_geojson(const nlohmann::json &j);
std::vector<DemandPoint> demand_from_geojson(const nlohmann::json &j);

bool load_json_file(const std::string &filename, nlohmann::json &j);
// Chooses CSV for a .csv extension (any case), JSON otherwise.
bool load_vehicles(const std::string &filename, const Options &opts, std::vector<Vehicle> &out);
bool load_roads(const std::string &filename, std::vector<RoadGeometry> &out);
bool load_demand(const std::string &filename, std::vector<DemandPoint> &out);
