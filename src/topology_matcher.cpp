#include "topology_matcher.h"

#include <deque>
#include <map>

namespace schsync {

static void check_converged(const CanonicalCircuit& cc, const char* side,
                            MatchResult& result, SyncContext& ctx) {
    if (cc.converged) return;
    result.diagnostics.push_back(ctx.warn(DiagnosticKind::RefinementBoundExceeded,
        std::string(side) + " circuit did not stabilize within " +
        std::to_string(cc.final_round()) + " refinement rounds; topology matches have reduced confidence"));
}

MatchResult match_by_topology(const CanonicalCircuit& existing,
                              const CanonicalCircuit& target,
                              SyncContext& ctx) {
    MatchResult result;
    check_converged(existing, "existing", result, ctx);
    check_converged(target, "target", result, ctx);

    int round = common_round(existing, target);
    ctx.log("Topology match at refinement round " + std::to_string(round) + ": " +
            std::to_string(target.components.size()) + " target vs " +
            std::to_string(existing.components.size()) + " existing components");

    // Existing components per signature, in input order
    std::map<Signature, std::deque<size_t>> groups;
    for (size_t i = 0; i < existing.components.size(); ++i) {
        groups[existing.signature(i, round)].push_back(i);
    }

    std::vector<bool> dest_used(existing.components.size(), false);
    for (size_t i = 0; i < target.components.size(); ++i) {
        auto it = groups.find(target.signature(i, round));
        if (it == groups.end() || it->second.empty()) {
            result.unmatched_source.push_back(target.components[i]);
            continue;
        }
        size_t d = it->second.front();
        it->second.pop_front();
        dest_used[d] = true;

        MatchedPair p;
        p.source = target.components[i];
        p.dest = existing.components[d];
        p.strategy = MatchStrategyKind::Topology;
        p.confidence = 1.0;
        ctx.log("  " + p.source.reference + " <-> " + p.dest.reference + " (topology)");
        result.pairs.push_back(std::move(p));
    }

    for (size_t d = 0; d < existing.components.size(); ++d) {
        if (!dest_used[d]) result.unmatched_dest.push_back(existing.components[d]);
    }

    ctx.log("Topology match: " + std::to_string(result.pairs.size()) + " paired, " +
            std::to_string(result.unmatched_source.size()) + " new, " +
            std::to_string(result.unmatched_dest.size()) + " unmatched existing");
    return result;
}

MatchResult match_by_topology(const SchematicSnapshot& existing,
                              const std::vector<ComponentRecord>& target,
                              SyncContext& ctx) {
    int bound = ctx.options().max_refinement_iterations;
    return match_by_topology(canonicalize(existing.components, bound),
                             canonicalize(target, bound), ctx);
}

} // namespace schsync
