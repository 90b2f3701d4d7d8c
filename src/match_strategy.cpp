#include "match_strategy.h"
#include "utils.h"

#include <algorithm>

namespace schsync {

const char* to_cstr(MatchStrategyKind k) {
    switch (k) {
        case MatchStrategyKind::Reference:      return "reference";
        case MatchStrategyKind::Connection:     return "connection";
        case MatchStrategyKind::ValueFootprint: return "value_footprint";
        case MatchStrategyKind::Topology:       return "topology";
    }
    return "reference";
}

// ── reference ───────────────────────────────────────────────────────

const ComponentRecord* ReferenceStrategy::try_match(const ComponentRecord& source,
                                                    const std::vector<const ComponentRecord*>& remaining_dest,
                                                    SyncContext& /*ctx*/) {
    for (auto* d : remaining_dest) {
        if (d->reference == source.reference) return d;
    }
    return nullptr;
}

// ── connection ──────────────────────────────────────────────────────

void ConnectionStrategy::prepare(const std::vector<ComponentRecord>& existing,
                                 const std::vector<ComponentRecord>& target,
                                 SyncContext& ctx) {
    signatures_.clear();
    reported_ = false;

    int bound = ctx.options().max_refinement_iterations;
    CanonicalCircuit ex = canonicalize(existing, bound);
    CanonicalCircuit tg = canonicalize(target, bound);
    int round = common_round(ex, tg);
    converged_ = ex.converged && tg.converged;

    for (size_t i = 0; i < existing.size(); ++i) signatures_[&existing[i]] = ex.signature(i, round);
    for (size_t i = 0; i < target.size(); ++i)   signatures_[&target[i]] = tg.signature(i, round);

    ctx.log("Connection signatures computed at round " + std::to_string(round) +
            (converged_ ? "" : " (not converged)"));
}

const ComponentRecord* ConnectionStrategy::try_match(const ComponentRecord& source,
                                                     const std::vector<const ComponentRecord*>& remaining_dest,
                                                     SyncContext& ctx) {
    auto src = signatures_.find(&source);
    if (src == signatures_.end()) return nullptr;

    for (auto* d : remaining_dest) {
        auto it = signatures_.find(d);
        if (it == signatures_.end() || it->second != src->second) continue;

        if (!converged_ && !reported_) {
            reported_ = true;
            ctx.warn(DiagnosticKind::RefinementBoundExceeded,
                     "connection matches use signatures that did not stabilize within " +
                     std::to_string(ctx.options().max_refinement_iterations) + " rounds");
        }
        return d;
    }
    return nullptr;
}

// ── value + footprint ───────────────────────────────────────────────

static bool same_part(const ComponentRecord& a, const ComponentRecord& b) {
    return a.symbol_id == b.symbol_id && a.value == b.value && a.footprint == b.footprint;
}

const ComponentRecord* ValueFootprintStrategy::try_match(const ComponentRecord& source,
                                                         const std::vector<const ComponentRecord*>& remaining_dest,
                                                         SyncContext& ctx) {
    std::vector<const ComponentRecord*> candidates;
    for (auto* d : remaining_dest) {
        if (same_part(source, *d)) candidates.push_back(d);
    }
    if (candidates.empty()) return nullptr;

    if (candidates.size() > 1) {
        std::vector<std::string> refs;
        for (auto* c : candidates) refs.push_back(c->reference);
        ctx.warn(DiagnosticKind::AmbiguousMatch,
                 source.reference + " (" + source.value + ", " + source.footprint + ") matches " +
                 join(refs, ", ") + "; using " + candidates.front()->reference);
    }
    return candidates.front();
}

// ── matcher ─────────────────────────────────────────────────────────

ComponentMatcher ComponentMatcher::with_default_strategies() {
    ComponentMatcher m;
    m.add_strategy(std::make_unique<ReferenceStrategy>());
    m.add_strategy(std::make_unique<ConnectionStrategy>());
    m.add_strategy(std::make_unique<ValueFootprintStrategy>());
    return m;
}

void ComponentMatcher::add_strategy(std::unique_ptr<MatchStrategy> strategy) {
    if (strategy) strategies_.push_back(std::move(strategy));
}

MatchResult ComponentMatcher::match(const std::vector<ComponentRecord>& existing,
                                    const std::vector<ComponentRecord>& target,
                                    SyncContext& ctx) {
    MatchResult result;
    size_t diag_mark = ctx.diagnostics().size();

    std::vector<const ComponentRecord*> remaining_dest;
    remaining_dest.reserve(existing.size());
    for (auto& c : existing) remaining_dest.push_back(&c);

    std::vector<const ComponentRecord*> remaining_source;
    remaining_source.reserve(target.size());
    for (auto& c : target) remaining_source.push_back(&c);

    for (auto& strategy : strategies_) {
        if (remaining_source.empty() || remaining_dest.empty()) break;
        strategy->prepare(existing, target, ctx);

        size_t before = result.pairs.size();
        std::vector<const ComponentRecord*> still_unmatched;
        for (auto* src : remaining_source) {
            const ComponentRecord* dest = strategy->try_match(*src, remaining_dest, ctx);
            if (!dest) {
                still_unmatched.push_back(src);
                continue;
            }
            remaining_dest.erase(std::find(remaining_dest.begin(), remaining_dest.end(), dest));

            MatchedPair p;
            p.source = *src;
            p.dest = *dest;
            p.strategy = strategy->kind();
            p.confidence = strategy->confidence();
            result.pairs.push_back(std::move(p));
        }
        remaining_source.swap(still_unmatched);

        ctx.log(std::string(to_cstr(strategy->kind())) + " strategy: " +
                std::to_string(result.pairs.size() - before) + " matched");
    }

    for (auto* s : remaining_source) result.unmatched_source.push_back(*s);
    for (auto* d : remaining_dest) result.unmatched_dest.push_back(*d);

    result.diagnostics.assign(ctx.diagnostics().begin() + diag_mark, ctx.diagnostics().end());
    return result;
}

MatchResult match_by_identity(const SchematicSnapshot& existing,
                              const std::vector<ComponentRecord>& target,
                              SyncContext& ctx) {
    ComponentMatcher matcher = ComponentMatcher::with_default_strategies();
    return matcher.match(existing.components, target, ctx);
}

MatchResult match_by_identity(const SchematicSnapshot& existing,
                              const TargetCircuit& target,
                              SyncContext& ctx) {
    return match_by_identity(existing, target.components, ctx);
}

} // namespace schsync
