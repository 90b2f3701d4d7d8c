#pragma once

#include "canonical.h"
#include "match_result.h"
#include "sync_context.h"

namespace schsync {

// First-generation matching: the destination has no identity we can trust, so
// components are paired purely by canonical signature.
//
// Components are grouped by signature at the common refinement round. Within a
// group the i-th target component (input order) pairs with the i-th existing
// one; surplus on either side is left unmatched. Components with identical
// signatures are interchangeable, so no further tie-break is attempted.
MatchResult match_by_topology(const CanonicalCircuit& existing,
                              const CanonicalCircuit& target,
                              SyncContext& ctx);

// Canonicalizes both sides with the context's refinement bound
MatchResult match_by_topology(const SchematicSnapshot& existing,
                              const std::vector<ComponentRecord>& target,
                              SyncContext& ctx);

} // namespace schsync
