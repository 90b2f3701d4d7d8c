#include "circuit_model.h"
#include "errors.h"

#include <algorithm>

namespace schsync {

const ComponentRecord* TargetCircuit::find(const std::string& reference) const {
    for (auto& c : components) {
        if (c.reference == reference) return &c;
    }
    return nullptr;
}

const ComponentRecord* SchematicSnapshot::find_by_id(const std::string& id) const {
    if (id.empty()) return nullptr;
    for (auto& c : components) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const ComponentRecord* SchematicSnapshot::find(const std::string& reference) const {
    for (auto& c : components) {
        if (c.reference == reference) return &c;
    }
    return nullptr;
}

const char* to_cstr(DestinationArtifact::Kind k) {
    switch (k) {
        case DestinationArtifact::WIRE:               return "wire";
        case DestinationArtifact::LABEL:              return "label";
        case DestinationArtifact::GLOBAL_LABEL:       return "global_label";
        case DestinationArtifact::HIERARCHICAL_LABEL: return "hierarchical_label";
        case DestinationArtifact::JUNCTION:           return "junction";
        case DestinationArtifact::POWER_SYMBOL:       return "power_symbol";
        case DestinationArtifact::NO_CONNECT:         return "no_connect";
        case DestinationArtifact::GRAPHIC:            return "graphic";
        case DestinationArtifact::TEXT:               return "text";
        case DestinationArtifact::OTHER:              return "other";
    }
    return "other";
}

DestinationArtifact::Kind parse_artifact_kind(const std::string& s) {
    if (s == "wire")               return DestinationArtifact::WIRE;
    if (s == "label")              return DestinationArtifact::LABEL;
    if (s == "global_label")       return DestinationArtifact::GLOBAL_LABEL;
    if (s == "hierarchical_label") return DestinationArtifact::HIERARCHICAL_LABEL;
    if (s == "junction")           return DestinationArtifact::JUNCTION;
    if (s == "power_symbol")       return DestinationArtifact::POWER_SYMBOL;
    if (s == "no_connect")         return DestinationArtifact::NO_CONNECT;
    if (s == "graphic")            return DestinationArtifact::GRAPHIC;
    if (s == "text")               return DestinationArtifact::TEXT;
    return DestinationArtifact::OTHER;
}

std::vector<NetRecord> derive_nets(const std::vector<ComponentRecord>& components) {
    return merge_nets({}, components);
}

std::vector<NetRecord> merge_nets(const std::vector<NetRecord>& explicit_nets,
                                  const std::vector<ComponentRecord>& components) {
    std::map<std::string, std::set<NetEndpoint>> by_name;
    for (auto& net : explicit_nets) {
        if (net.name.empty()) continue;
        by_name[net.name].insert(net.endpoints.begin(), net.endpoints.end());
    }
    for (auto& comp : components) {
        for (auto& [pin, net] : comp.pins) {
            if (net.empty()) continue;
            by_name[net].insert({comp.reference, pin});
        }
    }

    std::vector<NetRecord> nets;
    nets.reserve(by_name.size());
    for (auto& [name, eps] : by_name) {
        nets.push_back({name, eps});
    }
    return nets;
}

bool same_endpoints(const NetRecord& a, const NetRecord& b,
                    const std::map<std::string, std::string>& ref_map) {
    if (a.endpoints.size() != b.endpoints.size()) return false;
    std::set<NetEndpoint> resolved;
    for (auto& ep : a.endpoints) {
        auto it = ref_map.find(ep.reference);
        resolved.insert({it != ref_map.end() ? it->second : ep.reference, ep.pin});
    }
    return resolved == b.endpoints;
}

std::string validate_component(const ComponentRecord& rec, bool require_id) {
    if (rec.reference.empty()) return "component has no reference";
    if (rec.symbol_id.empty()) return "component " + rec.reference + " has no symbol";
    if (require_id && rec.id.empty()) return "component " + rec.reference + " has no id";
    for (auto& [pin, net] : rec.pins) {
        (void)net;
        if (pin.empty()) return "component " + rec.reference + " has an unnamed pin";
    }
    return {};
}

// ── builder ─────────────────────────────────────────────────────────

ComponentBuilder::ComponentBuilder(std::string reference) {
    rec_.reference = std::move(reference);
}

ComponentBuilder& ComponentBuilder::id(std::string id) {
    rec_.id = std::move(id);
    return *this;
}

ComponentBuilder& ComponentBuilder::symbol(std::string symbol_id) {
    rec_.symbol_id = std::move(symbol_id);
    return *this;
}

ComponentBuilder& ComponentBuilder::value(std::string value) {
    rec_.value = std::move(value);
    return *this;
}

ComponentBuilder& ComponentBuilder::footprint(std::string footprint) {
    rec_.footprint = std::move(footprint);
    return *this;
}

ComponentBuilder& ComponentBuilder::at(double x, double y, double rotation) {
    rec_.position = {x, y};
    rec_.rotation = normalize_rotation(rotation);
    return *this;
}

ComponentBuilder& ComponentBuilder::pin(const std::string& pin, const std::string& net) {
    rec_.pins[pin] = net;
    return *this;
}

ComponentBuilder& ComponentBuilder::field(const std::string& name, const std::string& value) {
    rec_.fields[name] = value;
    return *this;
}

ComponentRecord ComponentBuilder::build() const {
    std::string err = validate_component(rec_, false);
    if (!err.empty()) throw InvalidComponentError(err);
    return rec_;
}

ComponentRecord ComponentBuilder::build_placed() const {
    std::string err = validate_component(rec_, true);
    if (!err.empty()) throw InvalidComponentError(err);
    return rec_;
}

} // namespace schsync
