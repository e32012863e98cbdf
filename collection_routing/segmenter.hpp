#pragma once
#include <vector>
#include "model.hpp"

// Stops of one trip before sequencing.
struct TripDraft {
    int cluster_id;
    std::vector<int> member_ids;
};

// ceil(|cluster| / capacity) chunks in member order, each of at most
// `capacity` members. Throws CapacityError when capacity <= 0.
std::vector<TripDraft> segment_cluster(const Cluster &cluster, int capacity);
