#include "json_io.h"

#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace schsync {

// ── helpers ─────────────────────────────────────────────────────────

static Point read_point(const json& j) {
    if (j.is_array() && j.size() >= 2) {
        return {j[0].get<double>(), j[1].get<double>()};
    }
    return {};
}

static json point_json(const Point& pt) {
    return json::array({pt.x, pt.y});
}

static void read_string_map(const json& j, const char* key, std::map<std::string, std::string>& out) {
    if (!j.contains(key)) return;
    for (auto& [k, v] : j[key].items()) {
        // null = unconnected pin / empty field
        out[k] = v.is_null() ? std::string() : v.get<std::string>();
    }
}

static ComponentRecord read_component(const json& cj) {
    ComponentRecord c;
    c.id        = cj.value("uuid", "");
    c.reference = cj.value("reference", "");
    c.symbol_id = cj.value("symbol", "");
    c.value     = cj.value("value", "");
    c.footprint = cj.value("footprint", "");
    c.position  = read_point(cj.value("position", json::array()));
    c.rotation  = normalize_rotation(cj.value("rotation", 0.0));
    read_string_map(cj, "pins", c.pins);
    read_string_map(cj, "fields", c.fields);
    return c;
}

static json component_json(const ComponentRecord& c, bool placed) {
    json j;
    if (placed) j["uuid"] = c.id;
    j["reference"] = c.reference;
    j["symbol"]    = c.symbol_id;
    j["value"]     = c.value;
    j["footprint"] = c.footprint;
    if (placed) {
        j["position"] = point_json(c.position);
        j["rotation"] = c.rotation;
    }
    j["pins"]   = c.pins;
    j["fields"] = c.fields;
    return j;
}

static DestinationArtifact read_artifact(const json& aj) {
    DestinationArtifact a;
    a.kind = parse_artifact_kind(aj.value("kind", "other"));
    a.uuid = aj.value("uuid", "");
    a.text = aj.value("text", "");
    if (aj.contains("points")) {
        for (auto& pt : aj["points"]) {
            a.points.push_back(read_point(pt));
        }
    }
    return a;
}

// ── readers ─────────────────────────────────────────────────────────

bool read_target_json(std::istream& in, TargetCircuit& target) {
    try {
        json j = json::parse(in);

        if (j.contains("components")) {
            for (auto& cj : j["components"]) {
                target.components.push_back(read_component(cj));
            }
        }

        if (j.contains("sheets")) {
            for (auto& sj : j["sheets"]) {
                SheetSpec s;
                s.name        = sj.value("name", "");
                s.parent_name = sj.contains("parent") && !sj["parent"].is_null()
                                    ? sj["parent"].get<std::string>() : std::string();
                if (sj.contains("components")) {
                    for (auto& ref : sj["components"]) {
                        s.component_refs.push_back(ref.get<std::string>());
                    }
                }
                target.sheets.push_back(s);
            }
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[json] target parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_target_json(const std::string& json_text, TargetCircuit& target) {
    std::istringstream iss(json_text);
    return read_target_json(iss, target);
}

bool read_snapshots_json(std::istream& in, SnapshotMap& snapshots) {
    try {
        json j = json::parse(in);
        if (!j.contains("sheets")) return true;

        for (auto& sj : j["sheets"]) {
            SchematicSnapshot snap;
            snap.sheet_name     = sj.value("name", "/");
            snap.file           = sj.value("file", "");
            snap.tool_generated = sj.value("tool_generated", true);

            if (sj.contains("components")) {
                for (auto& cj : sj["components"]) {
                    snap.components.push_back(read_component(cj));
                }
            }
            if (sj.contains("artifacts")) {
                for (auto& aj : sj["artifacts"]) {
                    snap.artifacts.push_back(read_artifact(aj));
                }
            }

            std::string name = snap.sheet_name;
            if (snapshots.count(name)) {
                std::cerr << "[json] duplicate destination sheet '" << name << "', keeping the first\n";
                continue;
            }
            snapshots.emplace(name, std::move(snap));
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[json] snapshot parse error: " << e.what() << "\n";
        return false;
    }
}

bool read_snapshots_json(const std::string& json_text, SnapshotMap& snapshots) {
    std::istringstream iss(json_text);
    return read_snapshots_json(iss, snapshots);
}

// ── writers ─────────────────────────────────────────────────────────

void write_snapshots_json(std::ostream& out, const SnapshotMap& snapshots) {
    json sheets = json::array();
    for (auto& [name, snap] : snapshots) {
        json sj;
        sj["name"] = name;
        sj["file"] = snap.file;
        sj["tool_generated"] = snap.tool_generated;

        json comps = json::array();
        for (auto& c : snap.components) comps.push_back(component_json(c, true));
        sj["components"] = comps;

        json arts = json::array();
        for (auto& a : snap.artifacts) {
            json aj;
            aj["kind"] = to_cstr(a.kind);
            aj["uuid"] = a.uuid;
            aj["text"] = a.text;
            json pts = json::array();
            for (auto& pt : a.points) pts.push_back(point_json(pt));
            aj["points"] = pts;
            arts.push_back(aj);
        }
        sj["artifacts"] = arts;
        sheets.push_back(sj);
    }
    out << json{{"sheets", sheets}}.dump(2) << "\n";
}

static json field_set_json(const std::set<FieldName>& fields) {
    json arr = json::array();
    for (auto f : fields) arr.push_back(to_cstr(f));
    return arr;
}

static json update_json(const ComponentUpdate& u) {
    json j;
    j["uuid"]           = u.id;
    j["reference"]      = u.reference;
    j["dest_reference"] = u.dest_reference;
    j["strategy"]       = to_cstr(u.strategy);
    j["confidence"]     = u.confidence;
    j["overwrite"]      = field_set_json(u.overwrite);
    j["preserve"]       = field_set_json(u.preserve);
    j["position"]       = point_json(u.position);
    j["rotation"]       = u.rotation;
    j["annotations"]    = u.annotations;

    json deltas = json::array();
    for (auto& d : u.deltas) {
        json dj;
        dj["field"] = to_cstr(d.field);
        if (!d.key.empty()) dj["key"] = d.key;
        dj["old"] = d.old_value;
        dj["new"] = d.new_value;
        if (d.field == FieldName::Pins) {
            dj["label"] = d.adds_label() ? "add" : d.removes_label() ? "remove" : "update";
        }
        deltas.push_back(dj);
    }
    j["deltas"] = deltas;
    return j;
}

static json addition_json(const ComponentAddition& a) {
    json j = component_json(a.component, false);
    j["proposed_uuid"] = a.proposed_id;
    if (a.hint.empty()) {
        j["hint"] = nullptr;
    } else {
        j["hint"] = {
            {"near_uuid", a.hint.near_id},
            {"near_reference", a.hint.near_reference},
            {"anchor", point_json(a.hint.anchor)},
            {"shared_nets", a.hint.shared_nets}
        };
    }
    return j;
}

static json ref_list_json(const std::vector<ComponentRecord>& comps) {
    json arr = json::array();
    for (auto& c : comps) arr.push_back(json{{"uuid", c.id}, {"reference", c.reference}});
    return arr;
}

static json sheet_json(const SyncReport& s) {
    json j;
    j["name"]       = s.sheet;
    j["file"]       = s.file;
    j["mode"]       = to_cstr(s.mode);
    j["created"]    = s.created;
    j["orphaned"]   = s.orphaned;
    j["skipped"]    = s.skipped;
    j["error"]      = s.ok() ? json(nullptr) : json(s.error);
    j["structural"] = s.structural;

    json updates = json::array();
    for (auto& u : s.plan.updates) updates.push_back(update_json(u));
    j["updates"] = updates;

    json adds = json::array();
    for (auto& a : s.plan.to_add) adds.push_back(addition_json(a));
    j["additions"] = adds;

    j["removals"]  = ref_list_json(s.plan.to_remove);
    j["preserved"] = ref_list_json(s.plan.preserved);

    json diags = json::array();
    for (auto& d : s.diagnostics) {
        diags.push_back(json{{"kind", to_cstr(d.kind)}, {"message", d.message}});
    }
    j["diagnostics"] = diags;
    return j;
}

void write_plan_json(std::ostream& out, const ProjectReport& report) {
    json j;

    json sheets = json::array();
    for (auto& s : report.sheets) sheets.push_back(sheet_json(s));
    j["sheets"] = sheets;

    json scopes = json::object();
    for (auto& [name, sc] : report.scopes) {
        scopes[name] = {
            {"local", sc.local},
            {"shared", sc.shared},
            {"pass_through", sc.pass_through}
        };
    }
    j["net_scopes"] = scopes;
    j["structural_errors"] = report.structural_errors;

    json diags = json::array();
    for (auto& d : report.diagnostics) {
        diags.push_back(json{{"kind", to_cstr(d.kind)}, {"message", d.message}});
    }
    j["diagnostics"] = diags;

    ProjectTotals t = report.totals();
    j["totals"] = {
        {"sheets", t.sheets},
        {"failed", t.failed},
        {"matched", t.matched},
        {"modified", t.modified},
        {"added", t.added},
        {"removed", t.removed},
        {"preserved", t.preserved},
        {"warnings", t.warnings}
    };

    out << j.dump(2) << "\n";
}

} // namespace schsync
