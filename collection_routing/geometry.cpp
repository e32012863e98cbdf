#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>

static const double EARTH_RADIUS = 6378137.0;
static const double MAX_MERCATOR_LAT = 85.05112878;

double euclid_dist(const Coord &a, const Coord &b) {
    double dx = a.lon - b.lon;
    double dy = a.lat - b.lat;
    return std::sqrt(dx*dx + dy*dy);
}

double polyline_length(const std::vector<Coord> &pts) {
    double total = 0.0;
    for (size_t i = 0; i + 1 < pts.size(); ++i)
        total += euclid_dist(pts[i], pts[i + 1]);
    return total;
}

Projected to_web_mercator(const Coord &c) {
    const double PI = std::acos(-1.0);
    double lat = std::max(-MAX_MERCATOR_LAT, std::min(MAX_MERCATOR_LAT, c.lat));
    Projected p;
    p.x = EARTH_RADIUS * c.lon * PI / 180.0;
    p.y = EARTH_RADIUS * std::log(std::tan(PI / 4.0 + lat * PI / 360.0));
    return p;
}

std::size_t NodeKeyHash::operator()(const NodeKey &k) const {
    std::size_t h1 = std::hash<std::int64_t>()(k.x);
    std::size_t h2 = std::hash<std::int64_t>()(k.y);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

NodeKey make_node_key(const Coord &c, double quantum) {
    NodeKey k;
    if (quantum > 0.0) {
        k.x = std::llround(c.lon / quantum);
        k.y = std::llround(c.lat / quantum);
    } else {
        // +0.0 and -0.0 are the same coordinate
        double lon = c.lon == 0.0 ? 0.0 : c.lon;
        double lat = c.lat == 0.0 ? 0.0 : c.lat;
        std::memcpy(&k.x, &lon, sizeof(double));
        std::memcpy(&k.y, &lat, sizeof(double));
    }
    return k;
}
