#pragma once
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "graph.hpp"

struct RoadSegment {
    Coord start;
    Coord end;
    double distance_meters;
};

struct ClusterBounds {
    double min_lon, max_lon;
    double min_lat, max_lat;
};

struct ClusterRoads {
    int cluster_id;
    Vehicle vehicle;
    int buildings_count;
    std::vector<RoadSegment> roads;
    ClusterBounds bounds;
};

// Road edges touching the snapped node of every member of one cluster, plus
// the bounding box of the members. Empty for an unknown or empty cluster, or
// one with no active vehicle behind it.
std::optional<ClusterRoads> cluster_roads(const RoadGraph &g,
                                          const std::vector<DemandPoint> &demand,
                                          const std::vector<Vehicle> &active,
                                          const std::vector<Cluster> &clusters,
                                          int cluster_id,
                                          const Options &opts);

std::vector<ClusterRoads> all_cluster_roads(const RoadGraph &g,
                                            const std::vector<DemandPoint> &demand,
                                            const std::vector<Vehicle> &active,
                                            const std::vector<Cluster> &clusters,
                                            const Options &opts);

// Whole-string decimal cluster id; "3abc" and "" are rejected.
bool parse_cluster_id(const std::string &text, int &cluster_id);
