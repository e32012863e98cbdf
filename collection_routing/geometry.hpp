#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

struct Coord {
    double lon;
    double lat;
};

inline bool operator==(const Coord &a, const Coord &b) {
    return a.lon == b.lon && a.lat == b.lat;
}

// Planar distance in source units (degrees for WGS84 input).
double euclid_dist(const Coord &a, const Coord &b);

double polyline_length(const std::vector<Coord> &pts);

// Web Mercator (EPSG:3857) projection, meters.
struct Projected {
    double x;
    double y;
};

Projected to_web_mercator(const Coord &c);

// Identity of a road-graph node. With a positive quantum both axes are
// snapped to the grid; with quantum 0 the raw bit patterns are used.
struct NodeKey {
    std::int64_t x;
    std::int64_t y;

    bool operator==(const NodeKey &o) const { return x == o.x && y == o.y; }
};

struct NodeKeyHash {
    std::size_t operator()(const NodeKey &k) const;
};

NodeKey make_node_key(const Coord &c, double quantum);
