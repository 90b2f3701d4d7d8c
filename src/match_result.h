#pragma once

#include "circuit_model.h"
#include "sync_context.h"

#include <string>
#include <vector>

namespace schsync {

enum class MatchStrategyKind {
    Reference,       // same reference designator
    Connection,      // same canonical signature
    ValueFootprint,  // same (symbol, value, footprint)
    Topology         // first-generation signature grouping
};

const char* to_cstr(MatchStrategyKind k);

struct MatchedPair {
    ComponentRecord source;   // target circuit side
    ComponentRecord dest;     // destination schematic side
    MatchStrategyKind strategy = MatchStrategyKind::Reference;
    double confidence = 1.0;
};

// Every source and every destination component appears in at most one pair.
struct MatchResult {
    std::vector<MatchedPair> pairs;
    std::vector<ComponentRecord> unmatched_source;
    std::vector<ComponentRecord> unmatched_dest;
    std::vector<Diagnostic> diagnostics;

    const MatchedPair* find_by_source(const std::string& reference) const {
        for (auto& p : pairs) {
            if (p.source.reference == reference) return &p;
        }
        return nullptr;
    }

    const MatchedPair* find_by_dest(const std::string& reference) const {
        for (auto& p : pairs) {
            if (p.dest.reference == reference) return &p;
        }
        return nullptr;
    }

    size_t count(MatchStrategyKind k) const {
        size_t n = 0;
        for (auto& p : pairs) {
            if (p.strategy == k) n++;
        }
        return n;
    }
};

} // namespace schsync
