#include "segmenter.hpp"
#include <algorithm>

std::vector<TripDraft> segment_cluster(const Cluster &cluster, int capacity) {
    if (capacity <= 0)
        throw CapacityError(cluster.vehicle_id, capacity);

    std::vector<TripDraft> trips;
    const auto &members = cluster.member_ids;
    for (size_t start = 0; start < members.size(); start += capacity) {
        size_t end = std::min(members.size(), start + (size_t)capacity);
        TripDraft t;
        t.cluster_id = cluster.cluster_id;
        t.member_ids.assign(members.begin() + start, members.begin() + end);
        trips.push_back(t);
    }
    return trips;
}
