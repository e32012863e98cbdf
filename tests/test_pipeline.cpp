#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include <set>
#include "output.hpp"
#include "pipeline.hpp"
#include "test_helpers.hpp"

static RoadGeometry road_along(const std::vector<DemandPoint> &pts, double lat) {
    std::vector<Coord> v;
    for (const auto &p : pts) v.push_back({p.coord.lon, lat});
    return line_road(v);
}

static std::vector<int> trip_sizes(const RouteAssignment &ra) {
    std::vector<int> sizes;
    for (const auto &t : ra.trips) sizes.push_back(t.house_count());
    return sizes;
}

TEST(OptimizeRoutes, TenHousesTwoVehiclesCapacityFour) {
    Options opts;
    auto pts = line_of_points(10);
    std::vector<Vehicle> fleet = {make_vehicle("A", 4), make_vehicle("B", 4)};

    OptimizationResult res = optimize_routes({road_along(pts, 12.9705)}, pts, fleet, opts);

    EXPECT_EQ(res.active_vehicles, 2);
    EXPECT_EQ(res.total_houses, 10);
    EXPECT_EQ(res.total_trips, 4);
    EXPECT_EQ(res.degraded_segments, 0);
    ASSERT_EQ(res.route_assignments.size(), 2u);

    const auto &a = res.route_assignments[0];
    const auto &b = res.route_assignments[1];
    EXPECT_EQ(a.vehicle.id, "A");
    EXPECT_EQ(trip_sizes(a), (std::vector<int>{4, 1}));
    EXPECT_EQ(trip_sizes(b), (std::vector<int>{4, 1}));
    EXPECT_EQ(a.trips_assigned, 2);
    EXPECT_EQ(a.houses_assigned, 5);
    EXPECT_EQ(a.capacity_per_trip, 4);

    EXPECT_EQ(a.trips[0].trip_id, "A_T1");
    EXPECT_EQ(a.trips[1].trip_id, "A_T2");
    EXPECT_EQ(a.trips[0].cluster_id, 0);
    EXPECT_EQ(b.trips[0].cluster_id, 1);
    EXPECT_EQ(a.trips[0].ordered_stop_ids, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(a.trips[1].ordered_stop_ids, (std::vector<int>{4}));
    EXPECT_EQ(b.trips[0].ordered_stop_ids, (std::vector<int>{5, 6, 7, 8}));

    // route walks the road vertex by vertex
    ASSERT_EQ(a.trips[0].route_nodes.size(), 4u);
    EXPECT_DOUBLE_EQ(a.trips[0].route_nodes[0].lat, 12.9705);
    EXPECT_NEAR(a.trips[0].route_length, 0.003, 1e-9);
}

TEST(OptimizeRoutes, CoverageAndCapacityHold) {
    Options opts;
    auto pts = scattered_points(37);
    std::vector<Vehicle> fleet = {make_vehicle("A", 5), make_vehicle("B", 7), make_vehicle("C", 3)};
    std::vector<RoadGeometry> roads = {
        line_road({{77.0, 12.9}, {77.01, 12.9}, {77.02, 12.9}}),
        line_road({{77.01, 12.9}, {77.01, 12.91}, {77.01, 12.92}}),
        line_road({{77.0, 12.92}, {77.02, 12.92}}),
    };

    OptimizationResult res = optimize_routes(roads, pts, fleet, opts);

    std::multiset<int> seen;
    int house_total = 0;
    for (const auto &ra : res.route_assignments) {
        for (const auto &t : ra.trips) {
            EXPECT_LE(t.house_count(), ra.vehicle.capacity_per_trip);
            EXPECT_GT(t.house_count(), 0);
            EXPECT_FALSE(t.route_nodes.empty());
            house_total += t.house_count();
            seen.insert(t.ordered_stop_ids.begin(), t.ordered_stop_ids.end());
        }
    }
    EXPECT_EQ(house_total, 37);
    EXPECT_EQ(res.total_houses, 37);
    for (const auto &p : pts) EXPECT_EQ(seen.count(p.id), 1u);
}

TEST(OptimizeRoutes, RerunIsIdentical) {
    Options opts;
    auto pts = scattered_points(45, 777u);
    std::vector<Vehicle> fleet = {make_vehicle("A", 6), make_vehicle("B", 4), make_vehicle("C", 9)};
    std::vector<RoadGeometry> roads = {
        line_road({{77.0, 12.9}, {77.005, 12.905}, {77.01, 12.91}, {77.02, 12.92}}),
        line_road({{77.0, 12.92}, {77.01, 12.91}, {77.02, 12.9}}),
    };

    OptimizationResult first = optimize_routes(roads, pts, fleet, opts);
    OptimizationResult second = optimize_routes(roads, pts, fleet, opts);

    ASSERT_EQ(first.clusters.size(), second.clusters.size());
    for (size_t c = 0; c < first.clusters.size(); c++)
        EXPECT_EQ(first.clusters[c].member_ids, second.clusters[c].member_ids);

    ASSERT_EQ(first.route_assignments.size(), second.route_assignments.size());
    for (size_t v = 0; v < first.route_assignments.size(); v++) {
        const auto &ta = first.route_assignments[v].trips;
        const auto &tb = second.route_assignments[v].trips;
        ASSERT_EQ(ta.size(), tb.size());
        for (size_t t = 0; t < ta.size(); t++) {
            EXPECT_EQ(ta[t].ordered_stop_ids, tb[t].ordered_stop_ids);
            EXPECT_EQ(ta[t].route_nodes.size(), tb[t].route_nodes.size());
        }
    }
    EXPECT_EQ(result_to_json(first, opts), result_to_json(second, opts));
}

TEST(OptimizeRoutes, OnlyActiveVehiclesTakePart) {
    Options opts;
    std::vector<Vehicle> fleet = {
        make_vehicle("idle", 4, VehicleStatus::Inactive),
        make_vehicle("A", 4),
        make_vehicle("odd", 4, VehicleStatus::Unknown),
    };
    OptimizationResult res = optimize_routes(std::vector<RoadGeometry>{}, line_of_points(6), fleet, opts);

    EXPECT_EQ(res.active_vehicles, 1);
    ASSERT_EQ(res.route_assignments.size(), 1u);
    EXPECT_EQ(res.route_assignments[0].vehicle.id, "A");
    EXPECT_EQ(trip_sizes(res.route_assignments[0]), (std::vector<int>{4, 2}));
}

TEST(OptimizeRoutes, NoActiveVehicleAbortsTheRun) {
    Options opts;
    std::vector<Vehicle> fleet = {make_vehicle("idle", 4, VehicleStatus::Inactive)};
    try {
        optimize_routes(std::vector<RoadGeometry>{}, line_of_points(3), fleet, opts);
        FAIL() << "expected InputError";
    } catch (const InputError &e) {
        EXPECT_EQ(e.kind(), InputErrorKind::NoActiveVehicles);
        nlohmann::json failure = failure_to_json(e);
        EXPECT_EQ(failure["status"], "error");
        EXPECT_EQ(failure["error"], "NoActiveVehicles");
    }
}

TEST(OptimizeRoutes, RepeatedVehicleIdAbortsTheRun) {
    Options opts;
    std::vector<Vehicle> fleet = {make_vehicle("V1", 4), make_vehicle("V1", 4)};
    try {
        optimize_routes(std::vector<RoadGeometry>{}, line_of_points(10), fleet, opts);
        FAIL() << "expected InputError";
    } catch (const InputError &e) {
        EXPECT_EQ(e.kind(), InputErrorKind::DuplicateVehicleId);
        EXPECT_EQ(failure_to_json(e)["error"], "DuplicateVehicleId");
    }
}

TEST(OptimizeRoutes, InactiveVehicleMaySharePlateWithActiveOne) {
    Options opts;
    std::vector<Vehicle> fleet = {make_vehicle("V1", 4, VehicleStatus::Inactive), make_vehicle("V1", 4)};
    OptimizationResult res = optimize_routes(std::vector<RoadGeometry>{}, line_of_points(3), fleet, opts);
    EXPECT_EQ(res.active_vehicles, 1);
    EXPECT_EQ(res.total_houses, 3);
}

TEST(OptimizeRoutes, EmptyDemandAbortsTheRun) {
    Options opts;
    EXPECT_THROW(optimize_routes(std::vector<RoadGeometry>{}, {}, {make_vehicle("A", 4)}, opts),
                 InputError);
}

TEST(OptimizeRoutes, ZeroCapacityVehicleIsExcludedNotFatal) {
    Options opts;
    auto pts = line_of_points(10);
    std::vector<Vehicle> fleet = {make_vehicle("A", 4), make_vehicle("B", 0)};

    OptimizationResult res = optimize_routes({road_along(pts, 12.9705)}, pts, fleet, opts);

    ASSERT_EQ(res.route_assignments.size(), 2u);
    const auto &b = res.route_assignments[1];
    EXPECT_TRUE(b.capacity_rejected);
    EXPECT_TRUE(b.trips.empty());
    EXPECT_EQ(b.trips_assigned, 0);
    EXPECT_EQ(res.total_houses, 5);
    EXPECT_EQ(res.unassigned_houses, (std::vector<int>{5, 6, 7, 8, 9}));

    bool flagged = false;
    for (const auto &is : res.issues)
        if (is.kind == IssueKind::Capacity && is.subject == "B") flagged = true;
    EXPECT_TRUE(flagged);
}

TEST(OptimizeRoutes, DisjointRoadsDegradeButFinish) {
    Options opts;
    std::vector<DemandPoint> pts = {
        {0, {77.000, 12.9001}},
        {1, {77.001, 12.9001}},
        {2, {77.100, 12.9001}},
        {3, {77.101, 12.9001}},
    };
    std::vector<RoadGeometry> roads = {
        line_road({{77.000, 12.9}, {77.001, 12.9}}),
        line_road({{77.100, 12.9}, {77.101, 12.9}}),
    };

    OptimizationResult res = optimize_routes(roads, pts, {make_vehicle("A", 10)}, opts);

    EXPECT_EQ(res.total_houses, 4);
    EXPECT_GT(res.degraded_segments, 0);
    ASSERT_EQ(res.route_assignments[0].trips.size(), 1u);
    const Trip &t = res.route_assignments[0].trips[0];
    EXPECT_EQ(t.ordered_stop_ids, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(t.degraded_segments, 1);
    EXPECT_TRUE(std::isfinite(t.route_length));

    bool graph_issue = false;
    for (const auto &is : res.issues)
        if (is.kind == IssueKind::Graph) graph_issue = true;
    EXPECT_TRUE(graph_issue);
}

TEST(OptimizeRoutes, WithoutRoadsRoutesAreStraightLines) {
    Options opts;
    auto pts = line_of_points(3);
    OptimizationResult res = optimize_routes(std::vector<RoadGeometry>{}, pts, {make_vehicle("A", 5)}, opts);

    EXPECT_EQ(res.road_nodes, 0);
    const Trip &t = res.route_assignments[0].trips[0];
    ASSERT_EQ(t.route_nodes.size(), 3u);
    for (int i = 0; i < 3; i++) EXPECT_TRUE(t.route_nodes[i] == pts[i].coord);
}

TEST(OptimizeRoutes, SkippedGeometriesAreReported) {
    Options opts;
    auto pts = line_of_points(4);
    std::vector<RoadGeometry> roads = {road_along(pts, 12.9705), RoadGeometry{}, line_road({{1, 1}})};

    OptimizationResult res = optimize_routes(roads, pts, {make_vehicle("A", 5)}, opts);
    EXPECT_EQ(res.skipped_geometries, 2);
    EXPECT_EQ(res.road_nodes, 4);
    EXPECT_EQ(res.road_edges, 3);
    EXPECT_EQ(res.issues[0].kind, IssueKind::Geometry);
    EXPECT_EQ(res.total_houses, 4);
}

TEST(OptimizeRoutes, ExtraVehiclesGetNoTrips) {
    Options opts;
    std::vector<Vehicle> fleet = {make_vehicle("A", 5), make_vehicle("B", 5), make_vehicle("C", 5)};
    OptimizationResult res = optimize_routes(std::vector<RoadGeometry>{}, line_of_points(2, 77.0, 12.97, 0.01),
                                             fleet, opts);
    EXPECT_EQ(res.active_vehicles, 3);
    EXPECT_EQ(res.clusters.size(), 2u);
    EXPECT_TRUE(res.route_assignments[2].trips.empty());
    EXPECT_EQ(res.total_houses, 2);
}

TEST(ResultJson, CarriesSummaryAndTrips) {
    Options opts;
    auto pts = line_of_points(10);
    std::vector<Vehicle> fleet = {make_vehicle("A", 4), make_vehicle("B", 4)};
    OptimizationResult res = optimize_routes({road_along(pts, 12.9705)}, pts, fleet, opts);

    nlohmann::json j = result_to_json(res, opts);
    EXPECT_EQ(j["active_vehicles"], 2);
    EXPECT_EQ(j["total_houses"], 10);
    EXPECT_EQ(j["total_trips"], 4);
    ASSERT_TRUE(j["route_assignments"].contains("A"));

    const auto &a = j["route_assignments"]["A"];
    EXPECT_EQ(a["trips_assigned"], 2);
    EXPECT_EQ(a["houses_assigned"], 5);
    EXPECT_EQ(a["capacity_per_trip"], 4);
    EXPECT_EQ(a["vehicle_info"]["vehicle_id"], "A");

    const auto &trip = a["trips"][0];
    EXPECT_EQ(trip["trip_id"], "A_T1");
    EXPECT_EQ(trip["cluster_id"], 0);
    EXPECT_EQ(trip["house_count"], 4);
    EXPECT_EQ(trip["houses"].size(), 4u);
    EXPECT_EQ(trip["route"][0].size(), 2u);
    EXPECT_NEAR(trip["route_length_meters"].get<double>(), 0.003 * 111000.0, 1e-3);
}
