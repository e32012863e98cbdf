#include "stitcher.hpp"
#include <algorithm>
#include <limits>
#include <queue>
#include <utility>

using namespace std;

SPResult dijkstra(const RoadGraph &g, int source, int target) {
    SPResult res{false, 0.0, {}};
    int n = g.nodes.size();
    if (source < 0 || target < 0 || source >= n || target >= n)
        return res;
    if (source == target) {
        res.possible = true;
        res.path = {source};
        return res;
    }

    const double INF = numeric_limits<double>::infinity();
    vector<double> dist(n, INF);
    vector<int> parent(n, -1);
    dist[source] = 0.0;

    using P = pair<double,int>;
    priority_queue<P, vector<P>, greater<P>> pq;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (d > dist[u]) continue;
        if (u == target) break;
        auto it = g.adj.find(u);
        if (it == g.adj.end()) continue;

        for (const auto &e : it->second) {
            if (dist[u] + e.length < dist[e.v]) {
                dist[e.v] = dist[u] + e.length;
                parent[e.v] = u;
                pq.push({dist[e.v], e.v});
            }
        }
    }

    if (dist[target] == INF) return res;

    vector<int> path;
    for (int cur = target;;) {
        path.push_back(cur);
        if (cur == source) break;
        cur = parent[cur];
    }
    reverse(path.begin(), path.end());

    res.possible = true;
    res.cost = dist[target];
    res.path = path;
    return res;
}

StitchedRoute stitch_route(const RoadGraph &g, const vector<Stop> &ordered) {
    StitchedRoute route;
    if (ordered.empty()) return route;

    route.nodes.push_back(ordered[0].snap.coord);
    for (size_t i = 0; i + 1 < ordered.size(); i++) {
        const auto &a = ordered[i].snap;
        const auto &b = ordered[i + 1].snap;

        SPResult sp{false, 0.0, {}};
        if (a.snapped && b.snapped)
            sp = dijkstra(g, a.node, b.node);

        if (sp.possible) {
            // path[0] is the junction already on the route
            for (size_t j = 1; j < sp.path.size(); j++)
                route.nodes.push_back(g.nodes[sp.path[j]].coord());
        } else {
            route.nodes.push_back(b.coord);
            route.degraded_segments++;
        }
    }
    route.length = polyline_length(route.nodes);
    return route;
}
