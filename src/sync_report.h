#pragma once

#include "reconciler.h"
#include "sync_context.h"

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace schsync {

// Outcome of reconciling one sheet
struct SyncReport {
    std::string sheet;
    std::string file;
    MatchMode mode = MatchMode::Identity;     // mode actually used (never Auto)
    bool created = false;      // no destination snapshot existed
    bool orphaned = false;     // destination sheet no longer in the target hierarchy
    bool skipped = false;      // not reconciled because of a structural error

    MergePlan plan;
    std::map<MatchStrategyKind, size_t> matched_by;
    std::vector<Diagnostic> diagnostics;

    std::string error;         // per-sheet failure, empty on success
    bool structural = false;   // error comes from the hierarchy, not the sheet itself

    bool ok() const { return error.empty(); }

    size_t matched() const  { return plan.updates.size(); }
    size_t modified() const { return plan.modified_count(); }
    size_t added() const    { return plan.to_add.size(); }
    size_t removed() const  { return plan.to_remove.size(); }
    size_t preserved() const { return plan.preserved.size(); }
};

struct SheetScope {
    std::set<std::string> local;
    std::set<std::string> shared;
    std::set<std::string> pass_through;
};

struct ProjectTotals {
    size_t sheets = 0;
    size_t failed = 0;
    size_t matched = 0;
    size_t modified = 0;
    size_t added = 0;
    size_t removed = 0;
    size_t preserved = 0;
    size_t warnings = 0;
};

struct ProjectReport {
    std::vector<SyncReport> sheets;
    std::map<std::string, SheetScope> scopes;         // sheet name -> net scopes
    std::vector<std::string> structural_errors;
    std::vector<Diagnostic> diagnostics;               // not tied to a single sheet

    ProjectTotals totals() const;

    const SyncReport* find(const std::string& sheet) const;

    bool has_errors() const;
    bool has_structural_errors() const { return !structural_errors.empty(); }

    // No sheet needs writing
    bool is_noop() const;
};

// Human-readable summary, one block per sheet
void print_report(std::ostream& out, const ProjectReport& report, bool details = false);

} // namespace schsync
