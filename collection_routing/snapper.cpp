#include "snapper.hpp"

SnapResult snap_to_road(const RoadGraph &g, const Coord &pt) {
    if (g.nodes.empty())
        return SnapResult{-1, pt, 0.0, false};

    int best = 0;
    double bestD = euclid_dist(pt, g.nodes[0].coord());
    for (size_t i = 1; i < g.nodes.size(); i++) {
        double d = euclid_dist(pt, g.nodes[i].coord());
        if (d < bestD) { bestD = d; best = static_cast<int>(i); }
    }
    return SnapResult{best, g.nodes[best].coord(), bestD, true};
}
