#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "loaders.hpp"
#include "output.hpp"
#include "pipeline.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

static bool write_output(const string &path, const json &out) {
    ofstream out_file(path);
    if (!out_file) {
        cerr << "Failed to open output file " << path << "\n";
        return false;
    }
    out_file << out.dump(2);
    out_file.close();
    cout << "Output written to " << path << "\n";
    return true;
}

int main(int argc, char** argv) {
    if (argc != 5 && argc != 6) {
        cerr << "Usage: ./optimize_routes roads.geojson buildings.geojson vehicles.json|csv output.json [config.json]\n";
        return 1;
    }

    Options opts;
    if (argc == 6 && !load_options(argv[5], opts)) {
        cerr << "Failed to load config from " << argv[5] << "\n";
        return 1;
    }

    vector<RoadGeometry> roads;
    if (!load_roads(argv[1], roads)) {
        cerr << "Failed to load roads from " << argv[1] << "\n";
        return 1;
    }

    vector<DemandPoint> demand;
    if (!load_demand(argv[2], demand)) {
        cerr << "Failed to load buildings from " << argv[2] << "\n";
        return 1;
    }

    vector<Vehicle> vehicles;
    if (!load_vehicles(argv[3], opts, vehicles)) {
        cerr << "Failed to load vehicles from " << argv[3] << "\n";
        return 1;
    }

    cout << "Loaded " << roads.size() << " road features, " << demand.size()
         << " buildings, " << vehicles.size() << " vehicles\n";

    auto start_time = chrono::high_resolution_clock::now();

    json out;
    try {
        OptimizationResult res = optimize_routes(roads, demand, vehicles, opts);
        cout << "Road graph: " << res.road_nodes << " nodes, " << res.road_edges << " edges\n";

        auto end_time = chrono::high_resolution_clock::now();
        auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);
        cout << "Optimization completed in " << duration.count() << " ms\n";
        cout << "Route optimization: " << res.active_vehicles << " active vehicles, "
             << res.total_houses << " houses, " << res.total_trips << " trips\n";
        if (res.degraded_segments > 0)
            cout << "Degraded segments: " << res.degraded_segments << "\n";

        out = result_to_json(res, opts);
    } catch (const InputError &e) {
        cerr << "Optimization failed: " << e.what() << "\n";
        if (!write_output(argv[4], failure_to_json(e))) return 1;
        return 2;
    } catch (const exception &e) {
        cerr << "Optimization failed: " << e.what() << "\n";
        return 1;
    }

    return write_output(argv[4], out) ? 0 : 1;
}
