#pragma once

#include "canonical.h"
#include "match_result.h"
#include "sync_context.h"

#include <map>
#include <memory>
#include <vector>

namespace schsync {

// One way of pairing a target component with a destination component.
//
// Strategies are consulted in order. A component matched by one strategy is
// removed from consideration for all later ones, so a strategy only ever sees
// the destination components nobody has claimed yet.
class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;

    virtual MatchStrategyKind kind() const = 0;
    virtual double confidence() const = 0;

    // Called once per match run, before any try_match()
    virtual void prepare(const std::vector<ComponentRecord>& /*existing*/,
                         const std::vector<ComponentRecord>& /*target*/,
                         SyncContext& /*ctx*/) {}

    // Pick a partner for `source` among `remaining_dest` (pointers into the
    // `existing` vector given to prepare). Returns nullptr when there is none.
    virtual const ComponentRecord* try_match(const ComponentRecord& source,
                                             const std::vector<const ComponentRecord*>& remaining_dest,
                                             SyncContext& ctx) = 0;
};

// Exact reference designator equality
class ReferenceStrategy : public MatchStrategy {
public:
    MatchStrategyKind kind() const override { return MatchStrategyKind::Reference; }
    double confidence() const override { return 1.0; }

    const ComponentRecord* try_match(const ComponentRecord& source,
                                     const std::vector<const ComponentRecord*>& remaining_dest,
                                     SyncContext& ctx) override;
};

// Canonical signature equality. Both circuits are canonicalized as a whole in
// prepare(); signatures are looked up by record address.
class ConnectionStrategy : public MatchStrategy {
public:
    MatchStrategyKind kind() const override { return MatchStrategyKind::Connection; }
    double confidence() const override { return 0.8; }

    void prepare(const std::vector<ComponentRecord>& existing,
                 const std::vector<ComponentRecord>& target,
                 SyncContext& ctx) override;

    const ComponentRecord* try_match(const ComponentRecord& source,
                                     const std::vector<const ComponentRecord*>& remaining_dest,
                                     SyncContext& ctx) override;

private:
    std::map<const ComponentRecord*, Signature> signatures_;
    bool converged_ = true;
    bool reported_ = false;
};

// (symbol, value, footprint) equality; the first candidate in destination
// order wins and the tie is reported as an ambiguous match.
class ValueFootprintStrategy : public MatchStrategy {
public:
    MatchStrategyKind kind() const override { return MatchStrategyKind::ValueFootprint; }
    double confidence() const override { return 0.5; }

    const ComponentRecord* try_match(const ComponentRecord& source,
                                     const std::vector<const ComponentRecord*>& remaining_dest,
                                     SyncContext& ctx) override;
};

class ComponentMatcher {
public:
    ComponentMatcher() = default;

    // Reference, then connection, then value/footprint
    static ComponentMatcher with_default_strategies();

    void add_strategy(std::unique_ptr<MatchStrategy> strategy);
    size_t strategy_count() const { return strategies_.size(); }

    MatchResult match(const std::vector<ComponentRecord>& existing,
                      const std::vector<ComponentRecord>& target,
                      SyncContext& ctx);

private:
    std::vector<std::unique_ptr<MatchStrategy>> strategies_;
};

// Update-mode matching of a target sheet against its destination snapshot
MatchResult match_by_identity(const SchematicSnapshot& existing,
                              const std::vector<ComponentRecord>& target,
                              SyncContext& ctx);

MatchResult match_by_identity(const SchematicSnapshot& existing,
                              const TargetCircuit& target,
                              SyncContext& ctx);

} // namespace schsync
