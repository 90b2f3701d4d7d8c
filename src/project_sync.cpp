#include "project_sync.h"
#include "errors.h"
#include "match_strategy.h"
#include "reconciler.h"
#include "scope_resolver.h"
#include "topology_matcher.h"
#include "utils.h"

#include <set>

namespace schsync {

void validate_snapshot(const SchematicSnapshot& snapshot) {
    std::set<std::string> ids;
    for (auto& c : snapshot.components) {
        std::string err = validate_component(c, true);
        if (!err.empty()) throw SnapshotError(snapshot.sheet_name, err);
        if (!ids.insert(c.id).second) {
            throw SnapshotError(snapshot.sheet_name, "duplicate component id " + c.id +
                                " (" + c.reference + ")");
        }
    }
}

static void validate_target(const std::string& sheet, const std::vector<ComponentRecord>& target) {
    std::set<std::string> refs;
    for (auto& c : target) {
        std::string err = validate_component(c, false);
        if (!err.empty()) throw InvalidComponentError("sheet '" + sheet + "': " + err);
        if (!refs.insert(c.reference).second) {
            throw InvalidComponentError("sheet '" + sheet + "': duplicate reference " + c.reference);
        }
    }
}

ProjectSynchronizer::ProjectSynchronizer(const SyncOptions& opts)
    : opts_(opts) {}

SyncReport ProjectSynchronizer::sync_sheet(const std::string& sheet,
                                           const std::vector<ComponentRecord>& target,
                                           const SchematicSnapshot* existing) {
    SyncContext ctx(opts_);
    return reconcile_sheet(sheet, target, existing, ctx);
}

SyncReport ProjectSynchronizer::reconcile_sheet(const std::string& sheet,
                                                const std::vector<ComponentRecord>& target,
                                                const SchematicSnapshot* existing,
                                                SyncContext& ctx) {
    SyncReport r;
    r.sheet = sheet;
    r.created = existing == nullptr;

    SchematicSnapshot empty;
    empty.sheet_name = sheet;
    const SchematicSnapshot& snapshot = existing ? *existing : empty;
    r.file = snapshot.file;

    ctx.set_sheet(sheet);
    if (r.created) {
        ctx.note(DiagnosticKind::SheetCreated, "no destination schematic, every component is new");
    }

    try {
        validate_snapshot(snapshot);
        validate_target(sheet, target);

        MatchMode mode = ctx.options().mode;
        if (mode == MatchMode::Auto) {
            mode = snapshot.tool_generated ? MatchMode::Identity : MatchMode::Topology;
        }
        r.mode = mode;
        ctx.log(std::string("Matching ") + std::to_string(target.size()) + " target against " +
                std::to_string(snapshot.components.size()) + " existing components (" +
                to_cstr(mode) + ")");

        MatchResult match = mode == MatchMode::Topology
            ? match_by_topology(snapshot, target, ctx)
            : match_by_identity(snapshot, target, ctx);

        for (auto& p : match.pairs) r.matched_by[p.strategy]++;
        r.plan = build_merge_plan(match, ctx);
    } catch (const SyncError& e) {
        r.error = e.what();
        r.plan = MergePlan();
        r.plan.sheet = sheet;
        ctx.warn(DiagnosticKind::Note, std::string("sheet not reconciled: ") + e.what());
    }

    r.diagnostics = ctx.take_diagnostics();
    ctx.set_sheet("");
    return r;
}

static SyncReport structural_report(const std::string& sheet, const std::string& why) {
    SyncReport r;
    r.sheet = sheet;
    r.plan.sheet = sheet;
    r.skipped = true;
    r.structural = true;
    r.error = why;
    return r;
}

void ProjectSynchronizer::sync(const ProjectInput& input, ProjectReport& report) {
    report = ProjectReport();
    SyncContext ctx(opts_);

    SheetHierarchy hierarchy = build_sheet_hierarchy(input.target);
    std::vector<std::string> failed_sheets;

    for (auto& w : hierarchy.warnings) ctx.warn(DiagnosticKind::Note, w);
    report.diagnostics = ctx.take_diagnostics();

    // Sheets that never made it into a tree
    std::set<std::string> seen;
    for (auto& s : input.target.sheets) {
        auto err = hierarchy.errors.find(s.name);
        if (err == hierarchy.errors.end() || !seen.insert(s.name).second) continue;
        report.structural_errors.push_back("sheet '" + s.name + "': " + err->second);
        report.sheets.push_back(structural_report(s.name, err->second));
        failed_sheets.push_back(s.name);
    }

    // Target components per sheet, in target order
    std::map<std::string, std::vector<ComponentRecord>> components;
    for (auto& c : input.target.components) {
        auto it = hierarchy.component_sheet.find(c.reference);
        if (it != hierarchy.component_sheet.end()) components[it->second].push_back(c);
    }
    for (auto& s : input.target.sheets) {
        for (auto& ref : s.component_refs) {
            if (!input.target.find(ref)) ctx.log("sheet " + s.name + " lists unknown component " + ref);
        }
    }

    DeclaredNets declared;
    for (auto* node : hierarchy.nodes()) {
        auto& nets = declared[node];
        for (auto& c : components[node->name()]) {
            for (auto& [pin, net] : c.pins) {
                if (!net.empty()) nets.insert(net);
            }
        }
    }

    NetScopes scopes = compute_net_scopes(declared, opts_.power_nets_global);

    // Nets spanning disconnected trees abort every tree they touch
    std::map<const SheetNode*, std::string> aborted_roots;
    for (auto& c : scopes.conflicts) {
        std::vector<std::string> names;
        for (auto* s : c.sheets) names.push_back(s->name());
        std::string msg = "net '" + c.net + "' is referenced by sheets with no common ancestor: " +
                          join(names, ", ");
        report.structural_errors.push_back(msg);
        for (auto* s : c.sheets) aborted_roots.emplace(&s->root(), msg);
    }

    for (auto* node : hierarchy.nodes()) {
        SheetScope& sc = report.scopes[node->name()];
        auto pick = [&](const std::map<const SheetNode*, std::set<std::string>>& m) {
            auto it = m.find(node);
            return it != m.end() ? it->second : std::set<std::string>();
        };
        sc.local = pick(scopes.local);
        sc.shared = pick(scopes.shared);
        sc.pass_through = pick(scopes.pass_through);
    }

    for (auto* node : hierarchy.nodes()) {
        auto aborted = aborted_roots.find(&node->root());
        if (aborted != aborted_roots.end()) {
            report.sheets.push_back(structural_report(node->name(), aborted->second));
            failed_sheets.push_back(node->name());
            continue;
        }

        auto dest = input.destinations.find(node->name());
        const SchematicSnapshot* existing = dest != input.destinations.end() ? &dest->second : nullptr;
        report.sheets.push_back(reconcile_sheet(node->name(), components[node->name()], existing, ctx));
    }

    // Destination sheets the target no longer has
    for (auto& [name, snapshot] : input.destinations) {
        if (hierarchy.find(name) || hierarchy.errors.count(name)) continue;
        SyncReport r = reconcile_sheet(name, {}, &snapshot, ctx);
        r.orphaned = true;
        report.sheets.push_back(std::move(r));
    }

    ProjectTotals t = report.totals();
    ctx.log("Project: " + std::to_string(t.sheets) + " sheets, " + std::to_string(t.failed) + " failed");

    if (!report.structural_errors.empty()) {
        throw StructuralError(join(report.structural_errors, "; "), failed_sheets);
    }
}

} // namespace schsync
