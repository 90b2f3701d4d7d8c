#include "reconciler.h"
#include "utils.h"

#include <algorithm>
#include <map>

namespace schsync {

const char* to_cstr(FieldName f) {
    switch (f) {
        case FieldName::Reference:   return "reference";
        case FieldName::Symbol:      return "symbol";
        case FieldName::Value:       return "value";
        case FieldName::Footprint:   return "footprint";
        case FieldName::Pins:        return "pins";
        case FieldName::Fields:      return "fields";
        case FieldName::Position:    return "position";
        case FieldName::Rotation:    return "rotation";
        case FieldName::Annotations: return "annotations";
    }
    return "value";
}

// Target is authoritative for electrical intent and BOM data,
// the destination for placement and anything only it knows about.
static const std::set<FieldName> OVERWRITE_FIELDS = {
    FieldName::Reference, FieldName::Symbol, FieldName::Value,
    FieldName::Footprint, FieldName::Pins, FieldName::Fields
};
static const std::set<FieldName> PRESERVE_FIELDS = {
    FieldName::Position, FieldName::Rotation, FieldName::Annotations
};

static std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    return it != m.end() ? it->second : std::string();
}

std::vector<FieldDelta> diff_component(const ComponentRecord& dest, const ComponentRecord& source) {
    std::vector<FieldDelta> deltas;
    auto scalar = [&](FieldName f, const std::string& old_v, const std::string& new_v) {
        if (old_v != new_v) deltas.push_back({f, "", old_v, new_v});
    };
    scalar(FieldName::Reference, dest.reference, source.reference);
    scalar(FieldName::Symbol, dest.symbol_id, source.symbol_id);
    scalar(FieldName::Value, dest.value, source.value);
    scalar(FieldName::Footprint, dest.footprint, source.footprint);

    // A pin missing on one side counts as unconnected
    std::set<std::string> pins;
    for (auto& [pin, net] : dest.pins) pins.insert(pin);
    for (auto& [pin, net] : source.pins) pins.insert(pin);
    for (auto& pin : pins) {
        std::string old_net = lookup(dest.pins, pin);
        std::string new_net = lookup(source.pins, pin);
        if (old_net != new_net) deltas.push_back({FieldName::Pins, pin, old_net, new_net});
    }

    // Only keys the target provides; destination-only keys are annotations
    for (auto& [key, value] : source.fields) {
        auto it = dest.fields.find(key);
        if (it == dest.fields.end() || it->second != value) {
            deltas.push_back({FieldName::Fields, key, it == dest.fields.end() ? "" : it->second, value});
        }
    }
    return deltas;
}

static std::set<std::string> signal_nets(const ComponentRecord& c) {
    std::set<std::string> nets;
    for (auto& [pin, net] : c.pins) {
        if (!net.empty() && !is_power_net(net)) nets.insert(net);
    }
    return nets;
}

static PlacementHint placement_hint(const ComponentRecord& added, const std::vector<MatchedPair>& pairs) {
    PlacementHint hint;
    auto nets = signal_nets(added);
    if (nets.empty()) return hint;

    for (auto& p : pairs) {
        int shared = 0;
        for (auto& n : signal_nets(p.source)) {
            if (nets.count(n)) shared++;
        }
        if (shared > hint.shared_nets) {
            hint.near_id = p.dest.id;
            hint.near_reference = p.dest.reference;
            hint.anchor = p.dest.position;
            hint.shared_nets = shared;
        }
    }
    return hint;
}

MergePlan build_merge_plan(const MatchResult& match,
                           bool preserve_unmatched_destination,
                           SyncContext& ctx) {
    MergePlan plan;
    plan.sheet = ctx.sheet();

    for (auto& p : match.pairs) {
        ComponentUpdate u;
        u.id = p.dest.id;
        u.reference = p.source.reference;
        u.dest_reference = p.dest.reference;
        u.strategy = p.strategy;
        u.confidence = p.confidence;
        u.overwrite = OVERWRITE_FIELDS;
        u.preserve = PRESERVE_FIELDS;
        u.deltas = diff_component(p.dest, p.source);
        u.position = p.dest.position;
        u.rotation = p.dest.rotation;
        for (auto& [key, value] : p.dest.fields) {
            if (!p.source.fields.count(key)) u.annotations[key] = value;
        }

        if (u.has_changes()) {
            ctx.log("  update " + u.dest_reference +
                    (u.dest_reference != u.reference ? " -> " + u.reference : "") + ": " +
                    std::to_string(u.deltas.size()) + " field change(s)");
        }
        plan.updates.push_back(std::move(u));
    }

    for (auto& c : match.unmatched_source) {
        ComponentAddition a;
        a.component = c;
        a.proposed_id = generate_uuid_from_seed(plan.sheet + "/" + c.reference);
        a.hint = placement_hint(c, match.pairs);
        ctx.log("  add " + c.reference +
                (a.hint.empty() ? " at sheet edge" : " near " + a.hint.near_reference));
        plan.to_add.push_back(std::move(a));
    }

    for (auto& c : match.unmatched_dest) {
        if (preserve_unmatched_destination) {
            ctx.log("  keep " + c.reference + " (user-added, preserved)");
            plan.preserved.push_back(c);
        } else {
            ctx.log("  remove " + c.reference);
            plan.to_remove.push_back(c);
        }
    }

    ctx.log("Merge plan: " + std::to_string(plan.updates.size()) + " matched (" +
            std::to_string(plan.modified_count()) + " modified), " +
            std::to_string(plan.to_add.size()) + " to add, " +
            std::to_string(plan.to_remove.size()) + " to remove, " +
            std::to_string(plan.preserved.size()) + " preserved");
    return plan;
}

MergePlan build_merge_plan(const MatchResult& match, SyncContext& ctx) {
    return build_merge_plan(match, ctx.options().preserve_unmatched_destination, ctx);
}

bool MergePlan::is_noop() const {
    if (!to_add.empty() || !to_remove.empty()) return false;
    for (auto& u : updates) {
        if (u.has_changes()) return false;
    }
    return true;
}

size_t MergePlan::modified_count() const {
    size_t n = 0;
    for (auto& u : updates) {
        if (u.has_changes()) n++;
    }
    return n;
}

const ComponentUpdate* MergePlan::find_update(const std::string& id) const {
    for (auto& u : updates) {
        if (u.id == id) return &u;
    }
    return nullptr;
}

// ── apply ───────────────────────────────────────────────────────────

static void apply_delta(ComponentRecord& c, const FieldDelta& d) {
    switch (d.field) {
        case FieldName::Reference: c.reference = d.new_value; break;
        case FieldName::Symbol:    c.symbol_id = d.new_value; break;
        case FieldName::Value:     c.value = d.new_value; break;
        case FieldName::Footprint: c.footprint = d.new_value; break;
        case FieldName::Pins:      c.pins[d.key] = d.new_value; break;
        case FieldName::Fields:    c.fields[d.key] = d.new_value; break;
        default: break;  // preserved fields never carry deltas
    }
}

SchematicSnapshot apply_merge_plan(const SchematicSnapshot& snapshot, const MergePlan& plan) {
    SchematicSnapshot out = snapshot;

    auto removed = [&](const ComponentRecord& c) {
        for (auto& r : plan.to_remove) {
            if (r.has_id() ? r.id == c.id : r.reference == c.reference) return true;
        }
        return false;
    };
    out.components.erase(std::remove_if(out.components.begin(), out.components.end(), removed),
                         out.components.end());

    for (auto& u : plan.updates) {
        for (auto& c : out.components) {
            if (c.id != u.id) continue;
            for (auto& d : u.deltas) apply_delta(c, d);
            break;
        }
    }

    double edge_x = 0.0;
    for (auto& c : out.components) edge_x = std::max(edge_x, c.position.x);
    edge_x = snap_to_grid(edge_x + 10 * SCHEMATIC_GRID);

    std::map<std::string, int> placed_near;
    int placed_at_edge = 0;
    for (auto& a : plan.to_add) {
        ComponentRecord c = a.component;
        c.id = a.proposed_id;
        if (a.hint.empty()) {
            c.position = {edge_x, snap_to_grid(placed_at_edge++ * 6 * SCHEMATIC_GRID)};
        } else {
            int n = ++placed_near[a.hint.near_id];
            c.position = {snap_to_grid(a.hint.anchor.x + n * 4 * SCHEMATIC_GRID),
                          snap_to_grid(a.hint.anchor.y)};
        }
        c.rotation = 0.0;
        out.components.push_back(std::move(c));
    }

    out.tool_generated = true;
    return out;
}

} // namespace schsync
