#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "cluster_roads.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "loaders.hpp"
#include "output.hpp"
#include "partition.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc != 6 && argc != 7) {
        cerr << "Usage: ./cluster_roads roads.geojson buildings.geojson vehicles.json|csv <cluster_id|all> output.json [config.json]\n";
        return 1;
    }

    Options opts;
    if (argc == 7 && !load_options(argv[6], opts)) {
        cerr << "Failed to load config from " << argv[6] << "\n";
        return 1;
    }

    vector<RoadGeometry> roads;
    vector<DemandPoint> demand;
    vector<Vehicle> vehicles;
    if (!load_roads(argv[1], roads) || !load_demand(argv[2], demand) ||
        !load_vehicles(argv[3], opts, vehicles)) {
        cerr << "Cluster data not found. Check the input files\n";
        return 1;
    }

    string which = argv[4];
    int cluster_id = -1;
    if (which != "all" && !parse_cluster_id(which, cluster_id)) {
        cerr << "Invalid cluster id: " << which << "\n";
        return 1;
    }

    json out;
    try {
        BuildReport report;
        RoadGraph g = build_road_graph(roads, opts.node_precision, report);
        vector<Vehicle> active = select_active_vehicles(vehicles);
        vector<Cluster> clusters = partition_demand(demand, active, opts);

        if (which == "all") {
            out = all_cluster_roads_to_json(all_cluster_roads(g, demand, active, clusters, opts));
        } else {
            auto cr = cluster_roads(g, demand, active, clusters, cluster_id, opts);
            if (!cr) {
                cerr << "Cluster " << cluster_id << " not found\n";
                return 3;
            }
            cout << "Cluster " << cluster_id << ": " << cr->buildings_count << " buildings, "
                 << cr->roads.size() << " road segments\n";
            out = cluster_roads_to_json(*cr);
        }
    } catch (const InputError &e) {
        cerr << "Failed to get cluster roads: " << e.what() << "\n";
        out = failure_to_json(e);
    } catch (const exception &e) {
        cerr << "Failed to get cluster roads: " << e.what() << "\n";
        return 1;
    }

    ofstream out_file(argv[5]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[5] << "\n";
        return 1;
    }
    out_file << out.dump(2);
    out_file.close();

    cout << "Output written to " << argv[5] << "\n";
    return out.value("status", "") == "error" ? 2 : 0;
}
