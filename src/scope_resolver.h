#pragma once

#include "circuit_model.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace schsync {

// One sheet of a hierarchical schematic. Owns its children; the parent link
// is a non-owning back pointer (nullptr for a root).
class SheetNode {
public:
    explicit SheetNode(std::string name) : name_(std::move(name)) {}

    SheetNode(const SheetNode&) = delete;
    SheetNode& operator=(const SheetNode&) = delete;

    const std::string& name() const { return name_; }
    SheetNode* parent() const { return parent_; }
    const std::vector<std::unique_ptr<SheetNode>>& children() const { return children_; }

    SheetNode& add_child(std::string name);

    bool is_root() const { return parent_ == nullptr; }
    int depth() const;

    // Root first, this node last
    std::vector<const SheetNode*> ancestors() const;

    const SheetNode& root() const;

    // Sheet names from the root down, "/" for a root, "/power/ldo" below it
    std::string path() const;

    // Search this subtree by name
    const SheetNode* find(const std::string& name) const;
    SheetNode* find(const std::string& name);

    // Pre-order walk of this subtree
    std::vector<const SheetNode*> subtree() const;
    std::vector<SheetNode*> subtree();

    // Filled by resolve_scopes()
    std::set<std::string> local_nets;        // referenced here only
    std::set<std::string> shared_nets;       // lowest common declaring scope is this sheet
    std::set<std::string> pass_through_nets; // carried between a shared scope and a user below

private:
    std::string name_;
    SheetNode* parent_ = nullptr;
    std::vector<std::unique_ptr<SheetNode>> children_;
};

// Deepest sheet that is an ancestor of (or equal to) every sheet given.
// nullptr when the sheets are not all in the same tree, or the list is empty.
const SheetNode* lowest_common_ancestor(const std::vector<const SheetNode*>& sheets);

using DeclaredNets = std::map<const SheetNode*, std::set<std::string>>;

// A net referenced from sheets that share no ancestor
struct NetScopeConflict {
    std::string net;
    std::vector<const SheetNode*> sheets;
};

struct NetScopes {
    std::map<const SheetNode*, std::set<std::string>> local;
    std::map<const SheetNode*, std::set<std::string>> shared;
    std::map<const SheetNode*, std::set<std::string>> pass_through;
    std::map<std::string, const SheetNode*> owner;   // net -> declaring sheet
    std::vector<NetScopeConflict> conflicts;
};

// Scope assignment over any number of trees. Conflicts are collected, not thrown.
// With power_nets_global set, supply nets stay local to every sheet using them.
NetScopes compute_net_scopes(const DeclaredNets& declared, bool power_nets_global = true);

// Shared nets per sheet of `root`'s tree; also fills the scope sets on the
// nodes. Throws StructuralError when a net has no common ancestor.
std::map<const SheetNode*, std::set<std::string>> resolve_scopes(SheetNode& root,
                                                                 const DeclaredNets& declared,
                                                                 bool power_nets_global = true);

// Sheet tree built from the compiler's hierarchy metadata
struct SheetHierarchy {
    std::vector<std::unique_ptr<SheetNode>> roots;

    // Sheets that could not be placed in a tree: duplicate names, unknown
    // parents, cycles, and everything below them. Sheet name -> reason.
    std::map<std::string, std::string> errors;

    // Component reference -> sheet name
    std::map<std::string, std::string> component_sheet;

    // Non-fatal inconsistencies, e.g. a component listed on two sheets
    std::vector<std::string> warnings;

    const SheetNode* find(const std::string& name) const;
    SheetNode* find(const std::string& name);

    // Every placed sheet, pre-order per root
    std::vector<const SheetNode*> nodes() const;
};

// An empty sheet list yields a single root "/" holding every component.
// Components not listed by any sheet go to the first root.
SheetHierarchy build_sheet_hierarchy(const TargetCircuit& target);

} // namespace schsync
