#include "output.hpp"

using json = nlohmann::json;

static json coord_pair(const Coord &c) {
    return json::array({c.lon, c.lat});
}

static json lon_lat(const Coord &c) {
    return {{"longitude", c.lon}, {"latitude", c.lat}};
}

json result_to_json(const OptimizationResult &res, const Options &opts) {
    json out;
    out["status"] = "success";
    out["active_vehicles"] = res.active_vehicles;
    out["total_houses"] = res.total_houses;
    out["total_trips"] = res.total_trips;
    out["degraded_segments"] = res.degraded_segments;
    out["skipped_geometries"] = res.skipped_geometries;
    out["unassigned_houses"] = res.unassigned_houses;
    out["road_network"] = {{"nodes", res.road_nodes}, {"edges", res.road_edges}};

    out["route_assignments"] = json::object();
    for (const auto &ra : res.route_assignments) {
        json a;
        a["vehicle_info"] = {
            {"vehicle_id", ra.vehicle.id},
            {"vehicle_type", ra.vehicle.vehicle_type},
            {"status", ra.vehicle.status_text},
            {"trips_assigned", ra.trips_assigned},
            {"houses_assigned", ra.houses_assigned},
            {"capacity_per_trip", ra.capacity_per_trip}
        };
        a["trips_assigned"] = ra.trips_assigned;
        a["houses_assigned"] = ra.houses_assigned;
        a["capacity_per_trip"] = ra.capacity_per_trip;
        a["capacity_rejected"] = ra.capacity_rejected;

        a["trips"] = json::array();
        for (const auto &t : ra.trips) {
            json route = json::array();
            for (const auto &c : t.route_nodes) route.push_back(coord_pair(c));

            a["trips"].push_back({
                {"trip_id", t.trip_id},
                {"cluster_id", t.cluster_id},
                {"house_count", t.house_count()},
                {"houses", t.ordered_stop_ids},
                {"route", route},
                {"degraded_segments", t.degraded_segments},
                {"route_length_meters", t.route_length * opts.meters_per_degree}
            });
        }
        out["route_assignments"][ra.vehicle.id] = a;
    }

    out["issues"] = json::array();
    for (const auto &is : res.issues) {
        out["issues"].push_back({
            {"kind", issue_kind_name(is.kind)},
            {"subject", is.subject},
            {"reason", is.reason}
        });
    }
    return out;
}

json cluster_roads_to_json(const ClusterRoads &cr) {
    json roads = json::array();
    for (const auto &r : cr.roads) {
        roads.push_back({
            {"start_coordinate", lon_lat(r.start)},
            {"end_coordinate", lon_lat(r.end)},
            {"distance_meters", r.distance_meters}
        });
    }

    json out;
    out["cluster_id"] = cr.cluster_id;
    out["vehicle_info"] = {
        {"vehicle_id", cr.vehicle.id},
        {"vehicle_type", cr.vehicle.vehicle_type},
        {"status", cr.vehicle.status_text},
        {"capacity", cr.vehicle.capacity_per_trip}
    };
    out["buildings_count"] = cr.buildings_count;
    out["roads"] = roads;
    out["total_road_segments"] = cr.roads.size();
    out["cluster_bounds"] = {
        {"min_longitude", cr.bounds.min_lon},
        {"max_longitude", cr.bounds.max_lon},
        {"min_latitude", cr.bounds.min_lat},
        {"max_latitude", cr.bounds.max_lat}
    };
    return out;
}

json all_cluster_roads_to_json(const std::vector<ClusterRoads> &all) {
    json out;
    out["total_clusters"] = all.size();
    out["clusters"] = json::array();
    for (const auto &cr : all) out["clusters"].push_back(cluster_roads_to_json(cr));
    return out;
}

json failure_to_json(const InputError &e) {
    return {
        {"status", "error"},
        {"error", input_error_name(e.kind())},
        {"message", e.what()}
    };
}
