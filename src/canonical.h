#pragma once

#include "circuit_model.h"
#include "sync_context.h"

#include <cstdint>
#include <string>
#include <vector>

namespace schsync {

using Signature = std::uint64_t;

// Naming-independent view of a circuit.
//
// Round 0 colours every component by its symbol alone. Each further round
// re-colours a component from its previous colour plus the (pin, net colour)
// list of its pins, and a net from the sorted multiset of the colours of the
// components it touches. Refinement stops once a round produces no new
// classes, or at the iteration bound.
//
// Signatures of every round are kept: two circuits are only comparable at the
// same round, see common_round().
struct CanonicalCircuit {
    std::vector<ComponentRecord> components;         // input order
    std::vector<std::string> net_names;              // sorted by name
    std::vector<std::vector<Signature>> component_sigs; // [round][component]
    std::vector<std::vector<Signature>> net_sigs;       // [round][net]
    bool converged = true;

    int final_round() const { return static_cast<int>(component_sigs.size()) - 1; }

    // Signature of component i at `round`; rounds past the final one clamp to it
    Signature signature(size_t i, int round) const;
    Signature signature(size_t i) const { return signature(i, final_round()); }

    Signature net_signature(size_t j, int round) const;

    // Component signatures at `round`, sorted; equal for isomorphic circuits
    std::vector<Signature> sorted_signatures(int round) const;
    std::vector<Signature> sorted_signatures() const { return sorted_signatures(final_round()); }

    // Number of distinct component classes at `round`
    size_t class_count(int round) const;

    // Index of the component with this reference, or -1
    int index_of(const std::string& reference) const;
};

// Pure; output does not depend on component or net order.
// Nets given explicitly are merged with the nets implied by pin maps.
CanonicalCircuit canonicalize(const std::vector<ComponentRecord>& components,
                              const std::vector<NetRecord>& nets,
                              int max_iterations = DEFAULT_REFINEMENT_BOUND);

// Nets derived from pin maps only
CanonicalCircuit canonicalize(const std::vector<ComponentRecord>& components,
                              int max_iterations = DEFAULT_REFINEMENT_BOUND);

// Highest round both circuits have computed
int common_round(const CanonicalCircuit& a, const CanonicalCircuit& b);

// True when both circuits have the same sorted signatures at their common round
bool same_topology(const CanonicalCircuit& a, const CanonicalCircuit& b);

} // namespace schsync
