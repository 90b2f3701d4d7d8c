#pragma once

#include "circuit_model.h"
#include "match_result.h"
#include "sync_context.h"

#include <set>
#include <string>
#include <vector>

namespace schsync {

enum class FieldName {
    Reference,
    Symbol,
    Value,
    Footprint,
    Pins,         // pin -> net map
    Fields,       // extra fields provided by the target
    Position,
    Rotation,
    Annotations   // extra fields only the destination carries
};

const char* to_cstr(FieldName f);

// One concrete change the codec has to apply. For Pins the key is the pin
// number and the values are net names; for Fields the key is the field name.
struct FieldDelta {
    FieldName field = FieldName::Value;
    std::string key;
    std::string old_value;
    std::string new_value;

    // Net label operations on pins
    bool adds_label() const     { return field == FieldName::Pins && old_value.empty(); }
    bool removes_label() const  { return field == FieldName::Pins && new_value.empty(); }
    bool renames_label() const  { return field == FieldName::Pins && !old_value.empty() && !new_value.empty(); }
};

struct ComponentUpdate {
    std::string id;                 // destination uuid
    std::string reference;          // target reference (after the update)
    std::string dest_reference;     // reference in the destination before the update
    MatchStrategyKind strategy = MatchStrategyKind::Reference;
    double confidence = 1.0;

    std::set<FieldName> overwrite;
    std::set<FieldName> preserve;
    std::vector<FieldDelta> deltas;

    // Destination values carried through unchanged
    Point position;
    double rotation = 0.0;
    FieldMap annotations;

    bool has_changes() const { return !deltas.empty(); }
};

// Where a new component should go: next to the matched component that shares
// the most signal nets with it. An empty hint means "sheet edge".
struct PlacementHint {
    std::string near_id;
    std::string near_reference;
    Point anchor;
    int shared_nets = 0;

    bool empty() const { return near_id.empty(); }
};

struct ComponentAddition {
    ComponentRecord component;      // target record, no position assigned
    std::string proposed_id;        // deterministic from sheet and reference
    PlacementHint hint;
};

struct MergePlan {
    std::string sheet;
    std::vector<ComponentUpdate> updates;
    std::vector<ComponentAddition> to_add;
    std::vector<ComponentRecord> to_remove;
    std::vector<ComponentRecord> preserved;   // user-added, kept under policy

    // Nothing to write back to the destination
    bool is_noop() const;

    size_t modified_count() const;
    const ComponentUpdate* find_update(const std::string& id) const;
};

MergePlan build_merge_plan(const MatchResult& match,
                           bool preserve_unmatched_destination,
                           SyncContext& ctx);

// Uses the context's preserve_unmatched_destination option
MergePlan build_merge_plan(const MatchResult& match, SyncContext& ctx);

// Field deltas turning `dest` into `source` under the overwrite policy
std::vector<FieldDelta> diff_component(const ComponentRecord& dest, const ComponentRecord& source);

// In-memory application of a plan, as the codec's write path would do it.
// Destination-only artifacts pass through untouched. Additions are placed next
// to their hint anchor, or past the right-most component when there is none.
SchematicSnapshot apply_merge_plan(const SchematicSnapshot& snapshot, const MergePlan& plan);

} // namespace schsync
