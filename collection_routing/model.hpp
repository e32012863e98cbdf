#pragma once
#include <string>
#include <vector>
#include "geometry.hpp"
#include "errors.hpp"

struct DemandPoint {
    int id;
    Coord coord;
};

enum class VehicleStatus {
    Active,
    Inactive,
    Unknown
};

struct Vehicle {
    std::string id;
    int capacity_per_trip;
    VehicleStatus status;
    std::string status_text;
    std::string vehicle_type = "garbage_truck";
    std::string ward_no;
};

// One road feature; several parts for a multi-line.
struct RoadGeometry {
    std::vector<std::vector<Coord>> parts;
};

struct Cluster {
    int cluster_id;
    std::string vehicle_id;
    std::vector<int> member_ids;   // demand enumeration order
};

struct Trip {
    std::string trip_id;
    std::string vehicle_id;
    int cluster_id;
    std::vector<int> ordered_stop_ids;
    std::vector<Coord> route_nodes;
    int degraded_segments = 0;
    double route_length = 0.0;      // source units

    int house_count() const { return static_cast<int>(ordered_stop_ids.size()); }
};

struct RouteAssignment {
    Vehicle vehicle;
    std::vector<Trip> trips;
    int houses_assigned = 0;
    int trips_assigned = 0;
    int capacity_per_trip = 0;
    bool capacity_rejected = false;
};

struct OptimizationResult {
    int active_vehicles = 0;
    int total_houses = 0;
    int total_trips = 0;
    int degraded_segments = 0;
    int skipped_geometries = 0;
    int road_nodes = 0;
    int road_edges = 0;
    std::vector<int> unassigned_houses;
    std::vector<RouteAssignment> route_assignments;   // active vehicle order
    std::vector<Cluster> clusters;
    std::vector<Issue> issues;
};
