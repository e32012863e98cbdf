#include "loaders.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>

using json = nlohmann::json;
using namespace std;

struct FieldMapping {
    const char *canonical;
    vector<const char *> sources;
};

// vehicle schema v1, first listed source key wins
static const vector<FieldMapping> VEHICLE_SCHEMA_V1 = {
    {"vehicle_id",        {"vehicle_id", "vehicleNo", "vehicleId", "id",
                           "vehicle_number", "registration_number"}},
    {"capacity_per_trip", {"capacity_per_trip", "capacity", "vehicleCapacity"}},
    {"status",            {"status"}},
    {"vehicle_type",      {"vehicle_type", "vehicleType", "type"}},
    {"ward_no",           {"ward_no", "wardNo", "ward", "wardNumber"}},
};

static string lower(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return tolower(c); });
    return s;
}

static string trim(const string &s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static string as_text(const json &v) {
    if (v.is_string()) return v.get<string>();
    if (v.is_null()) return "";
    return v.dump();
}

VehicleStatus parse_vehicle_status(const string &text, const vector<string> &active_statuses) {
    string s = lower(trim(text));
    for (const auto &a : active_statuses)
        if (s == lower(a)) return VehicleStatus::Active;
    if (s == "inactive" || s == "offline" || s == "unavailable" || s == "maintenance")
        return VehicleStatus::Inactive;
    return VehicleStatus::Unknown;
}

static const json &vehicle_records(const json &j) {
    if (j.is_object()) {
        for (const char *key : {"content", "data", "vehicles"})
            if (j.contains(key) && j[key].is_array()) return j[key];
    }
    return j;
}

FieldBinding resolve_vehicle_fields(const json &records) {
    FieldBinding binding;
    for (const auto &m : VEHICLE_SCHEMA_V1) {
        for (const char *src : m.sources) {
            bool present = false;
            for (const auto &r : records)
                if (r.is_object() && r.contains(src)) { present = true; break; }
            if (present) { binding[m.canonical] = src; break; }
        }
    }
    return binding;
}

static int as_capacity(const json &v, int fallback) {
    if (v.is_number()) {
        double d = std::floor(v.get<double>());
        if (!std::isfinite(d)) return fallback;
        if (d >= static_cast<double>(numeric_limits<int>::max())) return numeric_limits<int>::max();
        if (d <= static_cast<double>(numeric_limits<int>::min())) return numeric_limits<int>::min();
        return static_cast<int>(d);
    }
    if (v.is_string()) {
        try {
            return stoi(v.get<string>());
        } catch (const exception &) {
            return fallback;
        }
    }
    return fallback;
}

vector<Vehicle> vehicles_from_json(const json &j, const Options &opts) {
    const json &records = vehicle_records(j);
    vector<Vehicle> out;
    if (!records.is_array()) {
        if (records.is_object()) return vehicles_from_json(json::array({records}), opts);
        return out;
    }

    FieldBinding fb = resolve_vehicle_fields(records);
    auto field = [&](const json &r, const char *canonical) -> const json * {
        auto it = fb.find(canonical);
        if (it == fb.end() || !r.contains(it->second)) return nullptr;
        return &r[it->second];
    };

    int n = 0;
    for (const auto &r : records) {
        n++;
        if (!r.is_object()) continue;

        Vehicle v;
        const json *id = field(r, "vehicle_id");
        v.id = id ? as_text(*id) : "";
        if (v.id.empty()) v.id = "vehicle_" + to_string(n);

        const json *cap = field(r, "capacity_per_trip");
        v.capacity_per_trip = cap ? as_capacity(*cap, opts.default_capacity) : opts.default_capacity;

        const json *st = field(r, "status");
        v.status_text = st ? as_text(*st) : "active";
        v.status = parse_vehicle_status(v.status_text, opts.active_statuses);

        const json *type = field(r, "vehicle_type");
        if (type) v.vehicle_type = as_text(*type);
        const json *ward = field(r, "ward_no");
        if (ward) v.ward_no = as_text(*ward);

        if (!opts.ward_no.empty() && trim(v.ward_no) != trim(opts.ward_no)) continue;
        out.push_back(v);
    }
    return out;
}

// A GeoJSON position whose first two entries are numbers.
static bool is_position(const json &c) {
    return c.is_array() && c.size() >= 2 && c[0].is_number() && c[1].is_number();
}

static vector<Coord> read_line(const json &coords) {
    vector<Coord> line;
    for (const auto &c : coords) {
        if (!is_position(c)) continue;
        line.push_back(Coord{c[0].get<double>(), c[1].get<double>()});
    }
    return line;
}

vector<RoadGeometry> roads_from_geojson(const json &j) {
    vector<RoadGeometry> roads;
    if (!j.contains("features")) return roads;

    for (const auto &f : j["features"]) {
        RoadGeometry rg;
        if (f.contains("geometry") && f["geometry"].is_object()) {
            const auto &geom = f["geometry"];
            string type = geom.value("type", "");
            json coords = geom.value("coordinates", json::array());
            if (type == "LineString") {
                rg.parts.push_back(read_line(coords));
            } else if (type == "MultiLineString") {
                for (const auto &part : coords)
                    rg.parts.push_back(read_line(part));
            }
        }
        roads.push_back(rg);
    }
    return roads;
}

// Area-weighted centroid of exterior rings; vertex mean when the area is zero.
static bool rings_centroid(const vector<vector<Coord>> &rings, Coord &out) {
    double area = 0.0, cx = 0.0, cy = 0.0;
    double sx = 0.0, sy = 0.0;
    int count = 0;

    for (const auto &ring : rings) {
        size_t n = ring.size();
        for (size_t i = 0; i < n; i++) {
            const Coord &a = ring[i];
            const Coord &b = ring[(i + 1) % n];
            double cross = a.lon * b.lat - b.lon * a.lat;
            area += cross;
            cx += (a.lon + b.lon) * cross;
            cy += (a.lat + b.lat) * cross;
            sx += a.lon;
            sy += a.lat;
            count++;
        }
    }
    if (count == 0) return false;

    if (std::fabs(area) < 1e-18) {
        out = Coord{sx / count, sy / count};
    } else {
        out = Coord{cx / (3.0 * area), cy / (3.0 * area)};
    }
    return true;
}

vector<DemandPoint> demand_from_geojson(const json &j) {
    vector<DemandPoint> demand;
    if (!j.contains("features")) return demand;

    int idx = -1;
    int skipped = 0;
    for (const auto &f : j["features"]) {
        idx++;
        if (!f.contains("geometry") || !f["geometry"].is_object()) { skipped++; continue; }
        const auto &geom = f["geometry"];
        string type = geom.value("type", "");
        json coords = geom.value("coordinates", json::array());

        vector<vector<Coord>> rings;
        if (type == "Point") {
            const auto &c = coords;
            if (is_position(c)) {
                demand.push_back(DemandPoint{idx, Coord{c[0].get<double>(), c[1].get<double>()}});
                continue;
            }
        } else if (type == "Polygon") {
            if (!coords.empty()) rings.push_back(read_line(coords[0]));
        } else if (type == "MultiPolygon") {
            for (const auto &poly : coords)
                if (!poly.empty()) rings.push_back(read_line(poly[0]));
        }

        Coord c;
        if (rings_centroid(rings, c)) {
            demand.push_back(DemandPoint{idx, c});
        } else {
            skipped++;
        }
    }

    if (skipped > 0)
        cerr << "Skipped " << skipped << " building feature(s) without usable geometry\n";
    return demand;
}

bool load_json_file(const string &filename, json &j)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open file: " << filename << "\n";
        return false;
    }
    try {
        fin >> j;
    } catch (const exception &e) {
        cerr << "Error parsing JSON in " << filename << ": " << e.what() << "\n";
        return false;
    }
    return true;
}

// Splits one CSV record; doubled quotes inside a quoted field are a literal quote.
static vector<string> split_csv_row(const string &row) {
    vector<string> cells;
    string cell;
    bool quoted = false;
    for (size_t i = 0; i < row.size(); i++) {
        char ch = row[i];
        if (quoted) {
            if (ch == '"' && i + 1 < row.size() && row[i + 1] == '"') { cell += '"'; i++; }
            else if (ch == '"') quoted = false;
            else cell += ch;
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            cells.push_back(cell);
            cell.clear();
        } else {
            cell += ch;
        }
    }
    cells.push_back(cell);
    return cells;
}

vector<Vehicle> vehicles_from_csv(istream &in, const Options &opts) {
    string line;
    vector<string> header;
    json records = json::array();
    while (getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        vector<string> cells = split_csv_row(line);
        if (header.empty()) {
            for (auto &c : cells) header.push_back(trim(c));
            continue;
        }
        json r = json::object();
        for (size_t i = 0; i < header.size() && i < cells.size(); i++) {
            if (header[i].empty()) continue;
            r[header[i]] = trim(cells[i]);
        }
        records.push_back(r);
    }
    return vehicles_from_json(records, opts);
}

static bool has_csv_extension(const string &filename) {
    if (filename.size() < 4) return false;
    return lower(filename.substr(filename.size() - 4)) == ".csv";
}

bool load_vehicles(const string &filename, const Options &opts, vector<Vehicle> &out) {
    if (has_csv_extension(filename)) {
        ifstream fin(filename);
        if (!fin) {
            cerr << "Could not open file: " << filename << "\n";
            return false;
        }
        out = vehicles_from_csv(fin, opts);
        return true;
    }
    json j;
    if (!load_json_file(filename, j)) return false;
    try {
        out = vehicles_from_json(j, opts);
    } catch (const exception &e) {
        cerr << "Malformed vehicle data: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool load_roads(const string &filename, vector<RoadGeometry> &out) {
    json j;
    if (!load_json_file(filename, j)) return false;
    try {
        out = roads_from_geojson(j);
    } catch (const exception &e) {
        cerr << "Malformed road GeoJSON: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool load_demand(const string &filename, vector<DemandPoint> &out) {
    json j;
    if (!load_json_file(filename, j)) return false;
    try {
        out = demand_from_geojson(j);
    } catch (const exception &e) {
        cerr << "Malformed building GeoJSON: " << e.what() << "\n";
        return false;
    }
    return true;
}
