#pragma once

#include "circuit_model.h"
#include "sync_report.h"

#include <istream>
#include <map>
#include <ostream>
#include <string>

namespace schsync {

using SnapshotMap = std::map<std::string, SchematicSnapshot>;

// Read the compiler's target circuit (components + sheet metadata).
// Returns true on success, false on parse error.
bool read_target_json(std::istream& in, TargetCircuit& target);
bool read_target_json(const std::string& json_text, TargetCircuit& target);

// Read destination snapshots as produced by the schematic codec, keyed by sheet.
// Returns true on success, false on parse error.
bool read_snapshots_json(std::istream& in, SnapshotMap& snapshots);
bool read_snapshots_json(const std::string& json_text, SnapshotMap& snapshots);

// Snapshots in the same layout read_snapshots_json() accepts
void write_snapshots_json(std::ostream& out, const SnapshotMap& snapshots);

// Merge plans, per-sheet reports, net scopes and totals for the codec's write path
void write_plan_json(std::ostream& out, const ProjectReport& report);

} // namespace schsync
