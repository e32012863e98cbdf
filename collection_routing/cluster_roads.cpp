#include "cluster_roads.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include "snapper.hpp"

using namespace std;

optional<ClusterRoads> cluster_roads(const RoadGraph &g,
                                     const vector<DemandPoint> &demand,
                                     const vector<Vehicle> &active,
                                     const vector<Cluster> &clusters,
                                     int cluster_id,
                                     const Options &opts)
{
    if (cluster_id < 0 || cluster_id >= (int)clusters.size()) return nullopt;
    if (cluster_id >= (int)active.size()) return nullopt;
    const Cluster &cl = clusters[cluster_id];
    if (cl.member_ids.empty()) return nullopt;

    unordered_map<int, Coord> where;
    for (const auto &p : demand) where[p.id] = p.coord;

    ClusterRoads out;
    out.cluster_id = cluster_id;
    out.buildings_count = cl.member_ids.size();
    out.vehicle = active[cluster_id];

    const Coord &first = where.at(cl.member_ids[0]);
    out.bounds = ClusterBounds{first.lon, first.lon, first.lat, first.lat};

    set<pair<int,int>> seen;
    for (int id : cl.member_ids) {
        const Coord &c = where.at(id);
        out.bounds.min_lon = min(out.bounds.min_lon, c.lon);
        out.bounds.max_lon = max(out.bounds.max_lon, c.lon);
        out.bounds.min_lat = min(out.bounds.min_lat, c.lat);
        out.bounds.max_lat = max(out.bounds.max_lat, c.lat);

        SnapResult s = snap_to_road(g, c);
        if (!s.snapped) continue;
        auto it = g.adj.find(s.node);
        if (it == g.adj.end()) continue;

        for (const auto &e : it->second) {
            auto key = make_pair(min(s.node, e.v), max(s.node, e.v));
            if (!seen.insert(key).second) continue;
            out.roads.push_back(RoadSegment{g.nodes[s.node].coord(), g.nodes[e.v].coord(),
                                            e.length * opts.meters_per_degree});
        }
    }
    return out;
}

bool parse_cluster_id(const string &text, int &cluster_id) {
    size_t pos = 0;
    try {
        cluster_id = stoi(text, &pos);
    } catch (const invalid_argument &) {
        return false;
    } catch (const out_of_range &) {
        return false;
    }
    return pos == text.size();
}

vector<ClusterRoads> all_cluster_roads(const RoadGraph &g,
                                       const vector<DemandPoint> &demand,
                                       const vector<Vehicle> &active,
                                       const vector<Cluster> &clusters,
                                       const Options &opts)
{
    vector<ClusterRoads> all;
    for (const auto &cl : clusters) {
        auto r = cluster_roads(g, demand, active, clusters, cl.cluster_id, opts);
        if (r) all.push_back(*r);
    }
    return all;
}
