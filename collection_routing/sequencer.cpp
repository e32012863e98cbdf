#include "sequencer.hpp"

std::vector<Stop> sequence_stops(const std::vector<Stop> &stops) {
    if (stops.empty()) return {};

    std::vector<Stop> order = {stops[0]};
    std::vector<Stop> remaining(stops.begin() + 1, stops.end());
    Coord current = stops[0].snap.coord;

    while (!remaining.empty()) {
        size_t best = 0;
        double bestD = euclid_dist(current, remaining[0].snap.coord);
        for (size_t i = 1; i < remaining.size(); i++) {
            double d = euclid_dist(current, remaining[i].snap.coord);
            if (d < bestD) { bestD = d; best = i; }
        }
        current = remaining[best].snap.coord;
        order.push_back(remaining[best]);
        remaining.erase(remaining.begin() + best);
    }
    return order;
}
