#include "graph.hpp"
#include <iostream>

int RoadGraph::findNode(const Coord &c) const {
    auto it = index_.find(make_node_key(c, precision_));
    return it == index_.end() ? -1 : it->second;
}

int RoadGraph::addNode(const Coord &c) {
    NodeKey key = make_node_key(c, precision_);
    auto it = index_.find(key);
    if (it != index_.end()) return it->second;

    int id = static_cast<int>(nodes.size());
    nodes.push_back(Node{id, c.lon, c.lat});
    index_[key] = id;
    return id;
}

bool RoadGraph::addEdge(int u, int v) {
    if (u == v) return false;
    auto &out = adj[u];
    for (const auto &e : out)
        if (e.v == v) return false;

    double w = euclid_dist(nodes[u].coord(), nodes[v].coord());
    out.push_back(Edge{v, w});
    adj[v].push_back(Edge{u, w});
    edge_count_++;
    return true;
}

void validate_line_part(const std::vector<Coord> &part, double node_precision) {
    if (part.empty())
        throw GeometryError("empty line");
    if (part.size() == 1)
        throw GeometryError("line has a single vertex");
    NodeKey first = make_node_key(part[0], node_precision);
    for (size_t i = 1; i < part.size(); ++i)
        if (!(make_node_key(part[i], node_precision) == first)) return;
    throw GeometryError("all vertices fall on one node");
}

RoadGraph build_road_graph(const std::vector<RoadGeometry> &roads,
                           double node_precision,
                           BuildReport &report)
{
    RoadGraph g(node_precision);

    for (size_t f = 0; f < roads.size(); ++f) {
        const auto &parts = roads[f].parts;
        if (parts.empty()) {
            report.skipped_parts++;
            report.issues.push_back({IssueKind::Geometry, "road " + std::to_string(f),
                                     "feature has no geometry"});
            continue;
        }

        for (size_t p = 0; p < parts.size(); ++p) {
            try {
                validate_line_part(parts[p], node_precision);
            } catch (const GeometryError &e) {
                report.skipped_parts++;
                report.issues.push_back({IssueKind::Geometry,
                                         "road " + std::to_string(f) + " part " + std::to_string(p),
                                         e.what()});
                continue;
            }

            int prev = g.addNode(parts[p][0]);
            for (size_t i = 1; i < parts[p].size(); ++i) {
                int cur = g.addNode(parts[p][i]);
                g.addEdge(prev, cur);
                prev = cur;
            }
            report.parts_used++;
        }
    }

    if (report.skipped_parts > 0)
        std::cerr << "Skipped " << report.skipped_parts << " degenerate road part(s)\n";

    return g;
}
