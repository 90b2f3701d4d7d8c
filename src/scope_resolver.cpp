#include "scope_resolver.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <functional>

namespace schsync {

// ── SheetNode ───────────────────────────────────────────────────────

SheetNode& SheetNode::add_child(std::string name) {
    children_.push_back(std::make_unique<SheetNode>(std::move(name)));
    children_.back()->parent_ = this;
    return *children_.back();
}

int SheetNode::depth() const {
    int d = 0;
    for (const SheetNode* p = parent_; p; p = p->parent_) d++;
    return d;
}

std::vector<const SheetNode*> SheetNode::ancestors() const {
    std::vector<const SheetNode*> path;
    for (const SheetNode* n = this; n; n = n->parent_) path.push_back(n);
    std::reverse(path.begin(), path.end());
    return path;
}

const SheetNode& SheetNode::root() const {
    const SheetNode* n = this;
    while (n->parent_) n = n->parent_;
    return *n;
}

std::string SheetNode::path() const {
    if (!parent_) return "/";
    std::string p = parent_->path();
    if (p.back() != '/') p += '/';
    return p + name_;
}

const SheetNode* SheetNode::find(const std::string& name) const {
    if (name_ == name) return this;
    for (auto& c : children_) {
        if (auto* hit = c->find(name)) return hit;
    }
    return nullptr;
}

SheetNode* SheetNode::find(const std::string& name) {
    return const_cast<SheetNode*>(static_cast<const SheetNode*>(this)->find(name));
}

std::vector<const SheetNode*> SheetNode::subtree() const {
    std::vector<const SheetNode*> out{this};
    for (auto& c : children_) {
        auto sub = static_cast<const SheetNode&>(*c).subtree();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

std::vector<SheetNode*> SheetNode::subtree() {
    std::vector<SheetNode*> out{this};
    for (auto& c : children_) {
        auto sub = c->subtree();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

// ── LCA ─────────────────────────────────────────────────────────────

const SheetNode* lowest_common_ancestor(const std::vector<const SheetNode*>& sheets) {
    if (sheets.empty()) return nullptr;

    std::vector<std::vector<const SheetNode*>> paths;
    for (auto* s : sheets) {
        if (!s) return nullptr;
        paths.push_back(s->ancestors());
    }

    const SheetNode* lca = nullptr;
    for (size_t depth = 0;; ++depth) {
        const SheetNode* candidate = nullptr;
        for (auto& p : paths) {
            if (depth >= p.size()) return lca;
            if (!candidate) candidate = p[depth];
            else if (p[depth] != candidate) return lca;
        }
        lca = candidate;
    }
}

// ── scope assignment ────────────────────────────────────────────────

static bool by_path(const SheetNode* a, const SheetNode* b) {
    return a->path() < b->path();
}

NetScopes compute_net_scopes(const DeclaredNets& declared, bool power_nets_global) {
    NetScopes scopes;

    std::map<std::string, std::vector<const SheetNode*>> users;
    for (auto& [sheet, nets] : declared) {
        if (!sheet) continue;
        for (auto& n : nets) {
            if (!n.empty()) users[n].push_back(sheet);
        }
    }

    for (auto& [net, sheets] : users) {
        std::sort(sheets.begin(), sheets.end(), by_path);
        sheets.erase(std::unique(sheets.begin(), sheets.end()), sheets.end());

        // Global power symbols connect these everywhere without hierarchy labels
        if (power_nets_global && is_power_net(net)) {
            for (auto* s : sheets) scopes.local[s].insert(net);
            continue;
        }

        if (sheets.size() == 1) {
            scopes.local[sheets.front()].insert(net);
            scopes.owner[net] = sheets.front();
            continue;
        }

        const SheetNode* lca = lowest_common_ancestor(sheets);
        if (!lca) {
            scopes.conflicts.push_back({net, sheets});
            continue;
        }

        scopes.shared[lca].insert(net);
        scopes.owner[net] = lca;
        for (auto* s : sheets) {
            if (s == lca) continue;   // nothing lies between a sheet and itself
            for (const SheetNode* n = s->parent(); n && n != lca; n = n->parent()) {
                scopes.pass_through[n].insert(net);
            }
        }
    }
    return scopes;
}

std::map<const SheetNode*, std::set<std::string>> resolve_scopes(SheetNode& root,
                                                                 const DeclaredNets& declared,
                                                                 bool power_nets_global) {
    NetScopes scopes = compute_net_scopes(declared, power_nets_global);

    for (auto& c : scopes.conflicts) {
        bool touches_tree = false;
        std::vector<std::string> names;
        for (auto* s : c.sheets) {
            names.push_back(s->name());
            if (&s->root() == &root) touches_tree = true;
        }
        if (touches_tree) {
            throw StructuralError("net '" + c.net + "' is referenced by sheets with no common ancestor: " +
                                  join(names, ", "), names);
        }
    }

    std::map<const SheetNode*, std::set<std::string>> shared;
    for (SheetNode* node : root.subtree()) {
        auto pick = [&](const std::map<const SheetNode*, std::set<std::string>>& m) {
            auto it = m.find(node);
            return it != m.end() ? it->second : std::set<std::string>();
        };
        node->local_nets = pick(scopes.local);
        node->shared_nets = pick(scopes.shared);
        node->pass_through_nets = pick(scopes.pass_through);
        if (!node->shared_nets.empty()) shared[node] = node->shared_nets;
    }
    return shared;
}

// ── hierarchy ───────────────────────────────────────────────────────

const SheetNode* SheetHierarchy::find(const std::string& name) const {
    for (auto& r : roots) {
        if (auto* hit = static_cast<const SheetNode&>(*r).find(name)) return hit;
    }
    return nullptr;
}

SheetNode* SheetHierarchy::find(const std::string& name) {
    for (auto& r : roots) {
        if (auto* hit = r->find(name)) return hit;
    }
    return nullptr;
}

std::vector<const SheetNode*> SheetHierarchy::nodes() const {
    std::vector<const SheetNode*> out;
    for (auto& r : roots) {
        auto sub = static_cast<const SheetNode&>(*r).subtree();
        out.insert(out.end(), sub.begin(), sub.end());
    }
    return out;
}

SheetHierarchy build_sheet_hierarchy(const TargetCircuit& target) {
    SheetHierarchy h;

    if (target.sheets.empty()) {
        h.roots.push_back(std::make_unique<SheetNode>("/"));
        for (auto& c : target.components) h.component_sheet[c.reference] = "/";
        return h;
    }

    std::map<std::string, const SheetSpec*> specs;
    for (auto& s : target.sheets) {
        if (!specs.emplace(s.name, &s).second) h.errors[s.name] = "duplicate sheet name";
    }

    // Walk every parent chain once; a chain either reaches a root or hits a
    // malformed sheet, and every sheet on it shares that fate.
    std::set<std::string> placeable;
    for (auto& s : target.sheets) {
        std::vector<std::string> chain;
        std::string cur = s.name;
        bool ok = false;
        std::string bad;
        while (true) {
            if (placeable.count(cur)) { ok = true; break; }
            if (h.errors.count(cur)) { bad = cur; break; }

            auto loop = std::find(chain.begin(), chain.end(), cur);
            if (loop != chain.end()) {
                for (auto it = loop; it != chain.end(); ++it) {
                    h.errors[*it] = "cyclic sheet reference";
                }
                chain.erase(loop, chain.end());
                bad = cur;
                break;
            }
            chain.push_back(cur);

            const std::string& parent = specs.at(cur)->parent_name;
            if (parent.empty()) { ok = true; break; }
            if (!specs.count(parent)) {
                h.errors[cur] = "unknown parent sheet '" + parent + "'";
                chain.pop_back();
                bad = cur;
                break;
            }
            cur = parent;
        }

        for (auto& name : chain) {
            if (ok) placeable.insert(name);
            else if (!h.errors.count(name)) h.errors[name] = "ancestor sheet '" + bad + "' is malformed";
        }
    }

    std::map<std::string, SheetNode*> built;
    std::function<SheetNode*(const std::string&)> place = [&](const std::string& name) -> SheetNode* {
        auto it = built.find(name);
        if (it != built.end()) return it->second;
        const SheetSpec* spec = specs.at(name);
        SheetNode* node;
        if (spec->parent_name.empty()) {
            h.roots.push_back(std::make_unique<SheetNode>(name));
            node = h.roots.back().get();
        } else {
            node = &place(spec->parent_name)->add_child(name);
        }
        built[name] = node;
        return node;
    };
    for (auto& s : target.sheets) {
        if (placeable.count(s.name) && !h.errors.count(s.name)) place(s.name);
    }

    for (auto& s : target.sheets) {
        if (specs.at(s.name) != &s) continue;   // duplicate entry
        for (auto& ref : s.component_refs) {
            auto [it, inserted] = h.component_sheet.emplace(ref, s.name);
            if (!inserted && it->second != s.name) {
                h.warnings.push_back("component " + ref + " is listed on sheets '" + it->second +
                                     "' and '" + s.name + "', keeping '" + it->second + "'");
            }
        }
    }
    if (!h.roots.empty()) {
        for (auto& c : target.components) h.component_sheet.emplace(c.reference, h.roots.front()->name());
    }
    return h;
}

} // namespace schsync
