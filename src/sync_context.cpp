#include "sync_context.h"

#include <iostream>

namespace schsync {

const char* to_cstr(MatchMode m) {
    switch (m) {
        case MatchMode::Auto:     return "auto";
        case MatchMode::Identity: return "identity";
        case MatchMode::Topology: return "topology";
    }
    return "auto";
}

bool parse_match_mode(const std::string& s, MatchMode& out) {
    if (s == "auto")     { out = MatchMode::Auto;     return true; }
    if (s == "identity") { out = MatchMode::Identity; return true; }
    if (s == "topology") { out = MatchMode::Topology; return true; }
    return false;
}

const char* to_cstr(DiagnosticKind k) {
    switch (k) {
        case DiagnosticKind::AmbiguousMatch:          return "ambiguous_match";
        case DiagnosticKind::RefinementBoundExceeded: return "refinement_bound_exceeded";
        case DiagnosticKind::SheetCreated:            return "sheet_created";
        case DiagnosticKind::Note:                    return "note";
    }
    return "note";
}

SyncContext::SyncContext(const SyncOptions& opts)
    : opts_(opts)
{
    if (opts_.max_refinement_iterations < 1) opts_.max_refinement_iterations = 1;
}

void SyncContext::log(const std::string& msg) const {
    if (opts_.verbose) {
        if (sheet_.empty())
            std::cerr << "[sync] " << msg << "\n";
        else
            std::cerr << "[sync " << sheet_ << "] " << msg << "\n";
    }
}

Diagnostic SyncContext::warn(DiagnosticKind kind, const std::string& msg) {
    diagnostics_.push_back({kind, sheet_, msg});
    std::cerr << "[WARNING] " << (sheet_.empty() ? "" : sheet_ + ": ") << msg << std::endl;
    return diagnostics_.back();
}

Diagnostic SyncContext::note(DiagnosticKind kind, const std::string& msg) {
    diagnostics_.push_back({kind, sheet_, msg});
    log(msg);
    return diagnostics_.back();
}

std::vector<Diagnostic> SyncContext::take_diagnostics() {
    std::vector<Diagnostic> out;
    out.swap(diagnostics_);
    return out;
}

} // namespace schsync
