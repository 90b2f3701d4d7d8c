#include "canonical.h"
#include "utils.h"

#include <algorithm>
#include <map>
#include <set>

namespace schsync {

static constexpr Signature FNV_OFFSET = 0xcbf29ce484222325ULL;
static constexpr Signature FNV_PRIME  = 0x100000001b3ULL;

// Net colour seen by a pin that is not connected to anything
static constexpr Signature UNCONNECTED = 0x9e3779b97f4a7c15ULL;

static Signature mix(Signature h, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        h ^= (v >> (i * 8)) & 0xFF;
        h *= FNV_PRIME;
    }
    return h;
}

static Signature hash_sorted(std::vector<Signature> values, Signature seed) {
    std::sort(values.begin(), values.end());
    Signature h = mix(FNV_OFFSET, seed);
    h = mix(h, values.size());
    for (auto v : values) h = mix(h, v);
    return h;
}

static size_t distinct(const std::vector<Signature>& sigs) {
    return std::set<Signature>(sigs.begin(), sigs.end()).size();
}

namespace {

// Adjacency shared by every refinement round
struct Graph {
    // per component: pin hash -> net index (-1 = unconnected), ordered by pin name
    std::vector<std::vector<std::pair<Signature, int>>> pins;
    // per net: component indices of its endpoints (with multiplicity)
    std::vector<std::vector<size_t>> members;
};

// Pin maps are attached by component index, so duplicate or placeholder
// references ("R?") do not mix up connectivity. Explicit net endpoints can only
// be resolved by reference and fill pins the pin map leaves out.
Graph build_graph(const std::vector<ComponentRecord>& components,
                  const std::vector<NetRecord>& explicit_nets,
                  const std::vector<std::string>& net_names) {
    Graph g;
    std::map<std::string, int> net_index;
    for (size_t j = 0; j < net_names.size(); ++j) net_index[net_names[j]] = static_cast<int>(j);

    std::vector<std::map<std::string, int>> pin_maps(components.size());
    g.members.resize(net_names.size());
    for (size_t i = 0; i < components.size(); ++i) {
        for (auto& [pin, net] : components[i].pins) {
            int j = net.empty() ? -1 : net_index.at(net);
            pin_maps[i][pin] = j;
            if (j >= 0) g.members[j].push_back(i);
        }
    }

    std::map<std::string, size_t> index;
    for (size_t i = 0; i < components.size(); ++i) {
        index.emplace(components[i].reference, i);  // first wins on duplicates
    }
    for (auto& net : explicit_nets) {
        auto j = net_index.find(net.name);
        if (j == net_index.end()) continue;
        for (auto& ep : net.endpoints) {
            auto it = index.find(ep.reference);
            if (it == index.end()) continue;
            if (!pin_maps[it->second].emplace(ep.pin, j->second).second) continue;
            g.members[j->second].push_back(it->second);
        }
    }

    g.pins.resize(components.size());
    for (size_t i = 0; i < components.size(); ++i) {
        for (auto& [pin, net] : pin_maps[i]) {
            g.pins[i].push_back({stable_hash(pin), net});
        }
    }
    return g;
}

std::vector<Signature> net_round(const Graph& g, const std::vector<Signature>& comp) {
    std::vector<Signature> out(g.members.size());
    for (size_t j = 0; j < g.members.size(); ++j) {
        std::vector<Signature> touching;
        touching.reserve(g.members[j].size());
        for (auto i : g.members[j]) touching.push_back(comp[i]);
        out[j] = hash_sorted(std::move(touching), 0x6e6574 /* "net" */);
    }
    return out;
}

std::vector<Signature> component_round(const Graph& g,
                                       const std::vector<Signature>& prev_comp,
                                       const std::vector<Signature>& prev_net) {
    std::vector<Signature> out(prev_comp.size());
    for (size_t i = 0; i < prev_comp.size(); ++i) {
        Signature h = mix(FNV_OFFSET, prev_comp[i]);
        for (auto& [pin_hash, net] : g.pins[i]) {
            h = mix(h, pin_hash);
            h = mix(h, net < 0 ? UNCONNECTED : prev_net[net]);
        }
        out[i] = h;
    }
    return out;
}

} // namespace

CanonicalCircuit canonicalize(const std::vector<ComponentRecord>& components,
                              const std::vector<NetRecord>& nets,
                              int max_iterations) {
    if (max_iterations < 1) max_iterations = 1;

    CanonicalCircuit cc;
    cc.components = components;

    for (auto& n : merge_nets(nets, components)) cc.net_names.push_back(n.name);  // sorted by name

    Graph g = build_graph(components, nets, cc.net_names);

    std::vector<Signature> comp(components.size());
    for (size_t i = 0; i < components.size(); ++i) {
        comp[i] = stable_hash(components[i].symbol_id);
    }
    std::vector<Signature> net = net_round(g, comp);
    cc.component_sigs.push_back(comp);
    cc.net_sigs.push_back(net);

    size_t prev_classes = distinct(comp) + distinct(net);
    cc.converged = false;
    for (int round = 1; round <= max_iterations; ++round) {
        comp = component_round(g, cc.component_sigs.back(), cc.net_sigs.back());
        net = net_round(g, comp);
        cc.component_sigs.push_back(comp);
        cc.net_sigs.push_back(net);

        size_t classes = distinct(comp) + distinct(net);
        if (classes == prev_classes) {
            cc.converged = true;
            break;
        }
        prev_classes = classes;
    }
    return cc;
}

CanonicalCircuit canonicalize(const std::vector<ComponentRecord>& components, int max_iterations) {
    return canonicalize(components, {}, max_iterations);
}

Signature CanonicalCircuit::signature(size_t i, int round) const {
    if (round > final_round()) round = final_round();
    if (round < 0) round = 0;
    return component_sigs[round].at(i);
}

Signature CanonicalCircuit::net_signature(size_t j, int round) const {
    if (round > final_round()) round = final_round();
    if (round < 0) round = 0;
    return net_sigs[round].at(j);
}

std::vector<Signature> CanonicalCircuit::sorted_signatures(int round) const {
    if (component_sigs.empty()) return {};
    if (round > final_round()) round = final_round();
    if (round < 0) round = 0;
    std::vector<Signature> out = component_sigs[round];
    std::sort(out.begin(), out.end());
    return out;
}

size_t CanonicalCircuit::class_count(int round) const {
    if (component_sigs.empty()) return 0;
    if (round > final_round()) round = final_round();
    if (round < 0) round = 0;
    return distinct(component_sigs[round]);
}

int CanonicalCircuit::index_of(const std::string& reference) const {
    for (size_t i = 0; i < components.size(); ++i) {
        if (components[i].reference == reference) return static_cast<int>(i);
    }
    return -1;
}

int common_round(const CanonicalCircuit& a, const CanonicalCircuit& b) {
    return std::min(a.final_round(), b.final_round());
}

bool same_topology(const CanonicalCircuit& a, const CanonicalCircuit& b) {
    int round = common_round(a, b);
    return a.sorted_signatures(round) == b.sorted_signatures(round);
}

} // namespace schsync
