#include "partition.hpp"
#include <algorithm>
#include <limits>
#include <random>
#include <unordered_set>

using namespace std;

vector<Vehicle> select_active_vehicles(const vector<Vehicle> &vehicles) {
    vector<Vehicle> out;
    for (const auto &v : vehicles)
        if (v.status == VehicleStatus::Active) out.push_back(v);
    return out;
}

static double sq_dist(const Projected &a, const Projected &b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return dx*dx + dy*dy;
}

// Raw engine output keeps draws identical across standard libraries.
static double draw_unit(mt19937 &rng) {
    return rng() / 4294967296.0;
}

static size_t draw_index(mt19937 &rng, size_t n) {
    return static_cast<size_t>(rng() % n);
}

static vector<Projected> seed_centers(const vector<Projected> &pts, int k, mt19937 &rng) {
    vector<Projected> centers;
    centers.push_back(pts[draw_index(rng, pts.size())]);

    vector<double> d2(pts.size());
    for (size_t i = 0; i < pts.size(); i++) d2[i] = sq_dist(pts[i], centers[0]);

    while ((int)centers.size() < k) {
        double total = 0.0;
        for (double d : d2) total += d;

        size_t pick = 0;
        if (total <= 0.0) {
            pick = draw_index(rng, pts.size());
        } else {
            double target = draw_unit(rng) * total;
            double acc = 0.0;
            pick = pts.size() - 1;
            for (size_t i = 0; i < pts.size(); i++) {
                acc += d2[i];
                if (acc > target && d2[i] > 0.0) { pick = i; break; }
            }
        }

        centers.push_back(pts[pick]);
        for (size_t i = 0; i < pts.size(); i++)
            d2[i] = min(d2[i], sq_dist(pts[i], pts[pick]));
    }
    return centers;
}

static bool assign_labels(const vector<Projected> &pts, const vector<Projected> &centers,
                          vector<int> &labels) {
    bool changed = false;
    for (size_t i = 0; i < pts.size(); i++) {
        int best = 0;
        double bestD = sq_dist(pts[i], centers[0]);
        for (int c = 1; c < (int)centers.size(); c++) {
            double d = sq_dist(pts[i], centers[c]);
            if (d < bestD) { bestD = d; best = c; }
        }
        if (labels[i] != best) { labels[i] = best; changed = true; }
    }
    return changed;
}

static void update_centers(const vector<Projected> &pts, vector<int> &labels,
                           vector<Projected> &centers) {
    int k = centers.size();
    vector<double> sx(k, 0.0), sy(k, 0.0);
    vector<int> count(k, 0);
    for (size_t i = 0; i < pts.size(); i++) {
        sx[labels[i]] += pts[i].x;
        sy[labels[i]] += pts[i].y;
        count[labels[i]]++;
    }
    for (int c = 0; c < k; c++)
        if (count[c] > 0) centers[c] = Projected{sx[c] / count[c], sy[c] / count[c]};

    // empty cluster: take over the point farthest from its own center
    for (int c = 0; c < k; c++) {
        if (count[c] > 0) continue;
        int far = -1;
        double farD = -1.0;
        for (size_t i = 0; i < pts.size(); i++) {
            if (count[labels[i]] <= 1) continue;
            double d = sq_dist(pts[i], centers[labels[i]]);
            if (d > farD) { farD = d; far = i; }
        }
        if (far < 0) break;
        count[labels[far]]--;
        labels[far] = c;
        count[c] = 1;
        centers[c] = pts[far];
    }
}

static double inertia(const vector<Projected> &pts, const vector<Projected> &centers,
                      const vector<int> &labels) {
    double total = 0.0;
    for (size_t i = 0; i < pts.size(); i++) total += sq_dist(pts[i], centers[labels[i]]);
    return total;
}

vector<int> kmeans_labels(const vector<Projected> &pts, int k, const Options &opts) {
    if (pts.empty() || k <= 0) return {};
    if (k == 1) return vector<int>(pts.size(), 0);

    mt19937 rng(opts.seed);
    vector<int> best_labels;
    double best_inertia = numeric_limits<double>::infinity();

    for (int run = 0; run < opts.kmeans_restarts; run++) {
        vector<Projected> centers = seed_centers(pts, k, rng);
        vector<int> labels(pts.size(), -1);
        assign_labels(pts, centers, labels);

        for (int it = 0; it < opts.kmeans_max_iterations; it++) {
            update_centers(pts, labels, centers);
            if (!assign_labels(pts, centers, labels)) break;
        }

        double score = inertia(pts, centers, labels);
        if (score < best_inertia) {
            best_inertia = score;
            best_labels = labels;
        }
    }
    return best_labels;
}

vector<Cluster> partition_demand(const vector<DemandPoint> &demand,
                                 const vector<Vehicle> &active,
                                 const Options &opts)
{
    if (demand.empty())
        throw InputError(InputErrorKind::EmptyDemand, "No demand points to assign");
    if (active.empty())
        throw InputError(InputErrorKind::NoActiveVehicles, "No active vehicles available for assignment");

    unordered_set<int> seen;
    for (const auto &p : demand) {
        if (!seen.insert(p.id).second)
            throw InputError(InputErrorKind::DuplicateDemandId,
                             "Duplicate demand point id " + to_string(p.id));
    }

    unordered_set<string> fleet_ids;
    for (const auto &v : active) {
        if (!fleet_ids.insert(v.id).second)
            throw InputError(InputErrorKind::DuplicateVehicleId,
                             "Duplicate active vehicle id " + v.id);
    }

    int k = (int)min(active.size(), demand.size());

    vector<Projected> pts;
    pts.reserve(demand.size());
    for (const auto &p : demand) pts.push_back(to_web_mercator(p.coord));

    vector<int> labels = kmeans_labels(pts, k, opts);

    // canonical numbering: order of first appearance in the demand list
    vector<int> remap(k, -1);
    int next = 0;
    for (int l : labels)
        if (remap[l] < 0) remap[l] = next++;
    for (int c = 0; c < k; c++)
        if (remap[c] < 0) remap[c] = next++;

    vector<Cluster> clusters(k);
    for (int c = 0; c < k; c++) {
        clusters[c].cluster_id = c;
        clusters[c].vehicle_id = active[c].id;
    }
    for (size_t i = 0; i < demand.size(); i++)
        clusters[remap[labels[i]]].member_ids.push_back(demand[i].id);

    return clusters;
}
