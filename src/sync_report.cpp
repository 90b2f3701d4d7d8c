#include "sync_report.h"
#include "utils.h"

namespace schsync {

ProjectTotals ProjectReport::totals() const {
    ProjectTotals t;
    for (auto& s : sheets) {
        t.sheets++;
        if (!s.ok()) t.failed++;
        t.matched += s.matched();
        t.modified += s.modified();
        t.added += s.added();
        t.removed += s.removed();
        t.preserved += s.preserved();
        for (auto& d : s.diagnostics) {
            if (d.kind == DiagnosticKind::AmbiguousMatch ||
                d.kind == DiagnosticKind::RefinementBoundExceeded) t.warnings++;
        }
    }
    return t;
}

const SyncReport* ProjectReport::find(const std::string& sheet) const {
    for (auto& s : sheets) {
        if (s.sheet == sheet) return &s;
    }
    return nullptr;
}

bool ProjectReport::has_errors() const {
    if (!structural_errors.empty()) return true;
    for (auto& s : sheets) {
        if (!s.ok()) return true;
    }
    return false;
}

bool ProjectReport::is_noop() const {
    for (auto& s : sheets) {
        if (s.ok() && !s.plan.is_noop()) return false;
    }
    return true;
}

static void print_delta(std::ostream& out, const FieldDelta& d) {
    out << "      ";
    if (d.field == FieldName::Pins) {
        if (d.adds_label())
            out << "pin " << d.key << ": + " << d.new_value;
        else if (d.removes_label())
            out << "pin " << d.key << ": - " << d.old_value;
        else
            out << "pin " << d.key << ": " << d.old_value << " -> " << d.new_value;
    } else {
        out << to_cstr(d.field);
        if (!d.key.empty()) out << " " << d.key;
        out << ": \"" << d.old_value << "\" -> \"" << d.new_value << "\"";
    }
    out << "\n";
}

void print_report(std::ostream& out, const ProjectReport& report, bool details) {
    for (auto& s : report.sheets) {
        out << "Sheet " << s.sheet;
        if (!s.file.empty()) out << " (" << s.file << ")";
        if (s.created) out << " [new]";
        if (s.orphaned) out << " [not in target]";
        out << "\n";

        if (!s.ok()) {
            out << "  " << (s.structural ? "Structural error: " : "Error: ") << s.error << "\n";
            continue;
        }

        out << "  Mode: " << to_cstr(s.mode) << "\n";
        out << "  Matched: " << s.matched();
        if (!s.matched_by.empty()) {
            std::vector<std::string> parts;
            for (auto& [kind, n] : s.matched_by) {
                parts.push_back(std::string(to_cstr(kind)) + " " + std::to_string(n));
            }
            out << " (" << join(parts, ", ") << ")";
        }
        out << "\n";
        out << "  Modified: " << s.modified() << "\n";
        out << "  Added: " << s.added() << "\n";
        out << "  Removed: " << s.removed() << "\n";
        out << "  Preserved: " << s.preserved() << "\n";

        if (details) {
            for (auto& u : s.plan.updates) {
                if (!u.has_changes()) continue;
                out << "    ~ " << u.dest_reference;
                if (u.dest_reference != u.reference) out << " -> " << u.reference;
                out << " at " << format_point(u.position) << "\n";
                for (auto& d : u.deltas) print_delta(out, d);
            }
            for (auto& a : s.plan.to_add) {
                out << "    + " << a.component.reference;
                if (!a.hint.empty()) out << " near " << a.hint.near_reference;
                out << "\n";
            }
            for (auto& r : s.plan.to_remove) out << "    - " << r.reference << "\n";
            for (auto& p : s.plan.preserved) out << "    = " << p.reference << " (user-added, preserved)\n";
        }

        for (auto& d : s.diagnostics) {
            if (d.kind == DiagnosticKind::AmbiguousMatch ||
                d.kind == DiagnosticKind::RefinementBoundExceeded) {
                out << "  Warning: " << d.message << "\n";
            }
        }

        auto sc = report.scopes.find(s.sheet);
        if (details && sc != report.scopes.end()) {
            auto list = [](const std::set<std::string>& nets) {
                return join(std::vector<std::string>(nets.begin(), nets.end()), ", ");
            };
            if (!sc->second.shared.empty())       out << "  Shared nets: " << list(sc->second.shared) << "\n";
            if (!sc->second.pass_through.empty()) out << "  Pass-through nets: " << list(sc->second.pass_through) << "\n";
        }
    }

    for (auto& d : report.diagnostics) {
        out << "Warning: " << d.message << "\n";
    }
    for (auto& e : report.structural_errors) {
        out << "Structural error: " << e << "\n";
    }

    ProjectTotals t = report.totals();
    out << "Total: " << t.sheets << " sheet(s), " << t.matched << " matched, "
        << t.modified << " modified, " << t.added << " added, "
        << t.removed << " removed, " << t.preserved << " preserved";
    if (t.failed) out << ", " << t.failed << " failed";
    out << "\n";
}

} // namespace schsync
