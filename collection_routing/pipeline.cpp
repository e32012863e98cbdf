#include "pipeline.hpp"
#include <iostream>
#include <unordered_map>
#include "aggregator.hpp"
#include "partition.hpp"
#include "segmenter.hpp"
#include "sequencer.hpp"
#include "stitcher.hpp"

using namespace std;

static Trip build_trip(const RoadGraph &g, const TripDraft &draft, const string &vehicle_id,
                       int trip_no, const unordered_map<int, SnapResult> &snaps)
{
    vector<Stop> stops;
    stops.reserve(draft.member_ids.size());
    for (int id : draft.member_ids)
        stops.push_back(Stop{id, snaps.at(id)});

    vector<Stop> ordered = sequence_stops(stops);
    StitchedRoute route = stitch_route(g, ordered);

    Trip t;
    t.trip_id = vehicle_id + "_T" + to_string(trip_no);
    t.vehicle_id = vehicle_id;
    t.cluster_id = draft.cluster_id;
    for (const auto &s : ordered) t.ordered_stop_ids.push_back(s.demand_id);
    t.route_nodes = route.nodes;
    t.degraded_segments = route.degraded_segments;
    t.route_length = route.length;
    return t;
}

OptimizationResult optimize_routes(const RoadGraph &g,
                                   const vector<DemandPoint> &demand,
                                   const vector<Vehicle> &vehicles,
                                   const Options &opts)
{
    vector<Vehicle> active = select_active_vehicles(vehicles);
    vector<Cluster> clusters = partition_demand(demand, active, opts);

    unordered_map<int, SnapResult> snaps;
    for (const auto &p : demand) snaps[p.id] = snap_to_road(g, p.coord);

    vector<VehiclePlan> plans;
    for (size_t i = 0; i < active.size(); i++) {
        VehiclePlan plan;
        plan.vehicle = active[i];

        if (i < clusters.size()) {
            try {
                auto drafts = segment_cluster(clusters[i], active[i].capacity_per_trip);
                for (size_t t = 0; t < drafts.size(); t++)
                    plan.trips.push_back(build_trip(g, drafts[t], active[i].id, t + 1, snaps));
            } catch (const CapacityError &e) {
                cerr << "Excluding vehicle: " << e.what() << "\n";
                plan.capacity_rejected = true;
                plan.dropped_ids = clusters[i].member_ids;
            }
        } else if (active[i].capacity_per_trip <= 0) {
            plan.capacity_rejected = true;
        }
        plans.push_back(plan);
    }

    OptimizationResult res = aggregate_assignments(plans, clusters);
    res.road_nodes = g.nodes.size();
    res.road_edges = g.edgeCount();
    return res;
}

OptimizationResult optimize_routes(const vector<RoadGeometry> &roads,
                                   const vector<DemandPoint> &demand,
                                   const vector<Vehicle> &vehicles,
                                   const Options &opts)
{
    BuildReport report;
    RoadGraph g = build_road_graph(roads, opts.node_precision, report);

    OptimizationResult res = optimize_routes(g, demand, vehicles, opts);
    res.skipped_geometries = report.skipped_parts;
    res.issues.insert(res.issues.begin(), report.issues.begin(), report.issues.end());
    return res;
}
