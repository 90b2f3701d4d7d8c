#pragma once

#include <string>
#include <vector>

namespace schsync {

constexpr int DEFAULT_REFINEMENT_BOUND = 4;

enum class MatchMode {
    Auto,       // identity when the snapshot is tool-generated, topology otherwise
    Identity,   // reference -> connection -> value/footprint
    Topology    // canonical signatures only (first generation onto an existing file)
};

const char* to_cstr(MatchMode m);
bool parse_match_mode(const std::string& s, MatchMode& out);

struct SyncOptions {
    bool preserve_unmatched_destination = true;
    int max_refinement_iterations = DEFAULT_REFINEMENT_BOUND;
    MatchMode mode = MatchMode::Auto;
    bool power_nets_global = true;   // keep GND/VCC/+3V3 out of hierarchical scope elevation
    bool verbose = false;
};

enum class DiagnosticKind {
    AmbiguousMatch,          // several equally valid value/footprint candidates
    RefinementBoundExceeded, // canonical signatures did not stabilize
    SheetCreated,            // sheet had no destination snapshot
    Note
};

const char* to_cstr(DiagnosticKind k);

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Note;
    std::string sheet;
    std::string message;
};

// Per-run state threaded through matcher, reconciler and resolver.
class SyncContext {
public:
    explicit SyncContext(const SyncOptions& opts = {});

    const SyncOptions& options() const { return opts_; }

    // Sheet currently being reconciled; tags diagnostics and log lines
    void set_sheet(const std::string& sheet) { sheet_ = sheet; }
    const std::string& sheet() const { return sheet_; }

    void log(const std::string& msg) const;
    // Record a diagnostic for the current sheet. warn() also echoes it to stderr.
    Diagnostic warn(DiagnosticKind kind, const std::string& msg);
    Diagnostic note(DiagnosticKind kind, const std::string& msg);

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    // Hand over everything collected since the last call
    std::vector<Diagnostic> take_diagnostics();

private:
    SyncOptions opts_;
    std::string sheet_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace schsync
