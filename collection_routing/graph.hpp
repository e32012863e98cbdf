#pragma once
#include <unordered_map>
#include <vector>
#include "model.hpp"

struct Node {
    int id;
    double lon;
    double lat;

    Coord coord() const { return Coord{lon, lat}; }
};

struct Edge {
    int v;
    double length;   // source coordinate units
};

// Undirected road graph. Node ids are dense and follow first-seen order,
// which is also the enumeration order used for nearest-node tie breaks.
class RoadGraph {
public:
    std::vector<Node> nodes;
    std::unordered_map<int, std::vector<Edge>> adj;

    explicit RoadGraph(double node_precision = 0.0) : precision_(node_precision) {}

    int findNode(const Coord &c) const;
    int addNode(const Coord &c);
    bool addEdge(int u, int v);
    int edgeCount() const { return edge_count_; }
    double precision() const { return precision_; }

private:
    std::unordered_map<NodeKey, int, NodeKeyHash> index_;
    double precision_;
    int edge_count_ = 0;
};

struct BuildReport {
    int parts_used = 0;
    int skipped_parts = 0;
    std::vector<Issue> issues;
};

// Throws GeometryError when a line part cannot contribute an edge, i.e. it
// has fewer than two distinct node keys at the given precision.
void validate_line_part(const std::vector<Coord> &part, double node_precision = 0.0);

RoadGraph build_road_graph(const std::vector<RoadGeometry> &roads,
                           double node_precision,
                           BuildReport &report);
