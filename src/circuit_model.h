#pragma once

#include "geometry.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace schsync {

// pin number -> net name ("" = unconnected)
using PinNetMap = std::map<std::string, std::string>;
using FieldMap = std::map<std::string, std::string>;

struct ComponentRecord {
    std::string id;          // destination uuid; empty on the target side
    std::string reference;   // "R1"
    std::string symbol_id;   // library symbol, e.g. "Device:R"
    std::string value;
    std::string footprint;
    Point position;
    double rotation = 0.0;
    PinNetMap pins;
    FieldMap fields;         // part number, DNP, tolerance, ...

    bool has_id() const { return !id.empty(); }
};

struct NetEndpoint {
    std::string reference;
    std::string pin;

    bool operator<(const NetEndpoint& o) const {
        return reference != o.reference ? reference < o.reference : pin < o.pin;
    }
    bool operator==(const NetEndpoint& o) const {
        return reference == o.reference && pin == o.pin;
    }
};

struct NetRecord {
    std::string name;
    std::set<NetEndpoint> endpoints;
};

// Hierarchy metadata emitted by the circuit compiler, one per sheet
struct SheetSpec {
    std::string name;
    std::string parent_name;                 // empty for a root sheet
    std::vector<std::string> component_refs;
};

struct TargetCircuit {
    std::vector<ComponentRecord> components;
    std::vector<SheetSpec> sheets;           // empty = single implicit root sheet

    const ComponentRecord* find(const std::string& reference) const;
};

// Destination-only schematic content the core passes through unexamined
struct DestinationArtifact {
    enum Kind { WIRE, LABEL, GLOBAL_LABEL, HIERARCHICAL_LABEL, JUNCTION,
                POWER_SYMBOL, NO_CONNECT, GRAPHIC, TEXT, OTHER };
    Kind kind = OTHER;
    std::string uuid;
    std::string text;                 // label text, power net, note
    std::vector<Point> points;
};

// One parsed destination sheet, as handed over by the file codec
struct SchematicSnapshot {
    std::string sheet_name;
    std::string file;
    bool tool_generated = true;       // references were assigned by us on a previous run
    std::vector<ComponentRecord> components;
    std::vector<DestinationArtifact> artifacts;

    const ComponentRecord* find_by_id(const std::string& id) const;
    const ComponentRecord* find(const std::string& reference) const;
};

const char* to_cstr(DestinationArtifact::Kind k);
DestinationArtifact::Kind parse_artifact_kind(const std::string& s);

// Build net records from component pin maps. Unconnected pins join no net.
std::vector<NetRecord> derive_nets(const std::vector<ComponentRecord>& components);

// Merge explicit nets with the nets implied by pin maps (union of endpoints by name)
std::vector<NetRecord> merge_nets(const std::vector<NetRecord>& explicit_nets,
                                  const std::vector<ComponentRecord>& components);

// Net identity after component identity resolution.
// ref_map maps references of `a` to references of `b`; unmapped references compare as-is.
bool same_endpoints(const NetRecord& a, const NetRecord& b,
                    const std::map<std::string, std::string>& ref_map);

// Returns an empty string when the record is complete, otherwise the reason.
std::string validate_component(const ComponentRecord& rec, bool require_id);

// Collects the fields of a component and validates them before handing out a record.
class ComponentBuilder {
public:
    explicit ComponentBuilder(std::string reference);

    ComponentBuilder& id(std::string id);
    ComponentBuilder& symbol(std::string symbol_id);
    ComponentBuilder& value(std::string value);
    ComponentBuilder& footprint(std::string footprint);
    ComponentBuilder& at(double x, double y, double rotation = 0.0);
    ComponentBuilder& pin(const std::string& pin, const std::string& net);
    ComponentBuilder& field(const std::string& name, const std::string& value);

    // Target-side record: reference and symbol required. Throws InvalidComponentError.
    ComponentRecord build() const;

    // Destination-side record: additionally requires an id. Throws InvalidComponentError.
    ComponentRecord build_placed() const;

private:
    ComponentRecord rec_;
};

} // namespace schsync
