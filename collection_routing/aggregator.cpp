#include "aggregator.hpp"

OptimizationResult aggregate_assignments(const std::vector<VehiclePlan> &plans,
                                         const std::vector<Cluster> &clusters)
{
    if (plans.empty())
        throw InputError(InputErrorKind::NoActiveVehicles, "No active vehicles available for assignment");

    OptimizationResult res;
    res.active_vehicles = plans.size();
    res.clusters = clusters;

    for (const auto &plan : plans) {
        RouteAssignment ra;
        ra.vehicle = plan.vehicle;
        ra.capacity_per_trip = plan.vehicle.capacity_per_trip;
        ra.capacity_rejected = plan.capacity_rejected;
        ra.trips = plan.trips;
        ra.trips_assigned = plan.trips.size();

        for (const auto &t : plan.trips) {
            ra.houses_assigned += t.house_count();
            res.degraded_segments += t.degraded_segments;
            if (t.degraded_segments > 0) {
                res.issues.push_back({IssueKind::Graph, t.trip_id,
                                      std::to_string(t.degraded_segments)
                                      + " segment(s) without a road path, joined directly"});
            }
        }

        if (plan.capacity_rejected) {
            res.unassigned_houses.insert(res.unassigned_houses.end(),
                                         plan.dropped_ids.begin(), plan.dropped_ids.end());
            res.issues.push_back({IssueKind::Capacity, plan.vehicle.id,
                                  "capacity_per_trip " + std::to_string(plan.vehicle.capacity_per_trip)
                                  + " is not positive, vehicle excluded"});
        }

        res.total_houses += ra.houses_assigned;
        res.total_trips += ra.trips_assigned;
        res.route_assignments.push_back(ra);
    }
    return res;
}
