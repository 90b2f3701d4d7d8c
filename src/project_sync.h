#pragma once

#include "circuit_model.h"
#include "sync_context.h"
#include "sync_report.h"

#include <map>
#include <string>
#include <vector>

namespace schsync {

struct ProjectInput {
    TargetCircuit target;
    std::map<std::string, SchematicSnapshot> destinations;   // keyed by sheet name
};

// Throws SnapshotError if the destination fragment cannot be reconciled
// (incomplete records, missing or duplicate ids).
void validate_snapshot(const SchematicSnapshot& snapshot);

// Drives one reconciliation per sheet and aggregates the results.
//
// A sheet that fails on its own (bad destination fragment, invalid target
// records) is reported and its siblings carry on. Hierarchy problems abort
// the affected subtree only; once every other sheet is done, sync() throws
// StructuralError. The report is filled either way.
class ProjectSynchronizer {
public:
    explicit ProjectSynchronizer(const SyncOptions& opts = {});

    void sync(const ProjectInput& input, ProjectReport& report);

    // Single sheet without hierarchy; existing may be nullptr for a new sheet
    SyncReport sync_sheet(const std::string& sheet,
                          const std::vector<ComponentRecord>& target,
                          const SchematicSnapshot* existing);

    const SyncOptions& options() const { return opts_; }

private:
    SyncOptions opts_;

    SyncReport reconcile_sheet(const std::string& sheet,
                               const std::vector<ComponentRecord>& target,
                               const SchematicSnapshot* existing,
                               SyncContext& ctx);
};

} // namespace schsync
