#include <catch2/catch.hpp>

#include "errors.h"
#include "scope_resolver.h"
#include "fixtures.h"

using namespace schsync;
using namespace schsync::test;

namespace {

// /
// └── amp
//     ├── left
//     └── right
struct AmpTree {
    SheetNode root{"/"};
    SheetNode* amp;
    SheetNode* left;
    SheetNode* right;

    AmpTree() {
        amp = &root.add_child("amp");
        left = &amp->add_child("left");
        right = &amp->add_child("right");
    }
};

SheetSpec sheet(const std::string& name, const std::string& parent,
                std::vector<std::string> refs = {}) {
    SheetSpec s;
    s.name = name;
    s.parent_name = parent;
    s.component_refs = std::move(refs);
    return s;
}

} // namespace

TEST_CASE("Sheet nodes know their place in the tree", "[scope][tree]") {
    AmpTree t;

    CHECK(t.root.is_root());
    CHECK(t.root.depth() == 0);
    CHECK(t.left->depth() == 2);
    CHECK(t.left->parent() == t.amp);
    CHECK(&t.left->root() == &t.root);

    CHECK(t.root.path() == "/");
    CHECK(t.amp->path() == "/amp");
    CHECK(t.right->path() == "/amp/right");

    auto chain = t.right->ancestors();
    REQUIRE(chain.size() == 3);
    CHECK(chain[0] == &t.root);
    CHECK(chain[1] == t.amp);
    CHECK(chain[2] == t.right);

    CHECK(t.root.find("left") == t.left);
    CHECK(t.amp->find("missing") == nullptr);
    CHECK(t.root.subtree().size() == 4);
}

TEST_CASE("Lowest common ancestor", "[scope][lca]") {
    AmpTree t;

    CHECK(lowest_common_ancestor({t.left, t.right}) == t.amp);
    CHECK(lowest_common_ancestor({t.left, t.amp}) == t.amp);
    CHECK(lowest_common_ancestor({t.left, &t.root}) == &t.root);
    CHECK(lowest_common_ancestor({t.left}) == t.left);
    CHECK(lowest_common_ancestor({}) == nullptr);

    SheetNode other("/other");
    CHECK(lowest_common_ancestor({t.left, &other}) == nullptr);
}

TEST_CASE("A net used by two siblings is shared at their parent", "[scope]") {
    AmpTree t;
    DeclaredNets declared = {
        {t.left, {"N", "FB_L"}},
        {t.right, {"N", "FB_R"}},
    };

    auto shared = resolve_scopes(t.root, declared);

    REQUIRE(shared.size() == 1);
    CHECK(shared.at(t.amp) == std::set<std::string>{"N"});
    CHECK(t.amp->shared_nets.count("N") == 1);
    CHECK(t.root.shared_nets.empty());
    CHECK(t.left->shared_nets.empty());
    CHECK(t.right->shared_nets.empty());

    // Nets referenced once stay with their sheet
    CHECK(t.left->local_nets == std::set<std::string>{"FB_L"});
    CHECK(t.right->local_nets == std::set<std::string>{"FB_R"});
    CHECK(t.amp->pass_through_nets.empty());
}

TEST_CASE("Intermediate sheets carry nets through", "[scope]") {
    AmpTree t;
    DeclaredNets declared = {
        {&t.root, {"SIG"}},
        {t.left, {"SIG"}},
    };

    resolve_scopes(t.root, declared);

    CHECK(t.root.shared_nets == std::set<std::string>{"SIG"});
    CHECK(t.amp->pass_through_nets == std::set<std::string>{"SIG"});
    CHECK(t.amp->shared_nets.empty());
    CHECK(t.left->pass_through_nets.empty());
}

TEST_CASE("A net shared by a sheet and its descendant stays below the sheet", "[scope]") {
    // / -> power -> ldo
    SheetNode root("/");
    SheetNode& power = root.add_child("power");
    SheetNode& ldo = power.add_child("ldo");
    DeclaredNets declared = {
        {&power, {"VOUT"}},
        {&ldo, {"VOUT"}},
    };

    auto shared = resolve_scopes(root, declared, false);

    REQUIRE(shared.size() == 1);
    CHECK(power.shared_nets == std::set<std::string>{"VOUT"});
    CHECK(root.pass_through_nets.count("VOUT") == 0);
    CHECK(power.pass_through_nets.empty());
    CHECK(ldo.pass_through_nets.empty());
    CHECK(ldo.shared_nets.empty());

    SECTION("deeper users pass through the sheets in between only") {
        SheetNode& reg = ldo.add_child("reg");
        DeclaredNets deeper = {
            {&power, {"VOUT"}},
            {&reg, {"VOUT"}},
        };
        resolve_scopes(root, deeper, false);
        CHECK(power.shared_nets == std::set<std::string>{"VOUT"});
        CHECK(ldo.pass_through_nets == std::set<std::string>{"VOUT"});
        CHECK(power.pass_through_nets.empty());
        CHECK(root.pass_through_nets.empty());
    }
}

TEST_CASE("Supply nets are global unless configured otherwise", "[scope][power]") {
    AmpTree t;
    DeclaredNets declared = {
        {t.left, {"GND", "+5V"}},
        {t.right, {"GND"}},
    };

    SECTION("global power symbols") {
        auto shared = resolve_scopes(t.root, declared);
        CHECK(shared.empty());
        CHECK(t.left->local_nets == std::set<std::string>{"+5V", "GND"});
        CHECK(t.right->local_nets == std::set<std::string>{"GND"});
    }

    SECTION("local power symbols") {
        auto shared = resolve_scopes(t.root, declared, false);
        REQUIRE(shared.count(t.amp) == 1);
        CHECK(shared.at(t.amp) == std::set<std::string>{"GND"});
        CHECK(t.left->local_nets == std::set<std::string>{"+5V"});
    }
}

TEST_CASE("Nets across disconnected trees are structural errors", "[scope][error]") {
    SheetNode a("/");
    SheetNode b("/other");
    SheetNode c("/third");
    DeclaredNets declared = {
        {&a, {"BRIDGE", "A_ONLY"}},
        {&b, {"BRIDGE"}},
        {&c, {"C_ONLY"}},
    };

    auto scopes = compute_net_scopes(declared);
    REQUIRE(scopes.conflicts.size() == 1);
    CHECK(scopes.conflicts[0].net == "BRIDGE");
    CHECK(scopes.conflicts[0].sheets.size() == 2);
    CHECK(scopes.owner.count("BRIDGE") == 0);

    CHECK_THROWS_AS(resolve_scopes(a, declared), StructuralError);

    try {
        resolve_scopes(b, declared);
        FAIL("expected StructuralError");
    } catch (const StructuralError& e) {
        CHECK(e.sheets().size() == 2);
    }

    // A tree the conflict does not touch resolves normally
    CHECK_NOTHROW(resolve_scopes(c, declared));
    CHECK(c.local_nets == std::set<std::string>{"C_ONLY"});
}

TEST_CASE("Sheet hierarchy from compiler metadata", "[scope][hierarchy]") {
    SECTION("no sheets means one implicit root") {
        TargetCircuit t;
        t.components = {resistor("R1", "1k", "A", "B"), resistor("R2", "1k", "B", "C")};

        auto h = build_sheet_hierarchy(t);
        REQUIRE(h.roots.size() == 1);
        CHECK(h.roots[0]->name() == "/");
        CHECK(h.errors.empty());
        CHECK(h.component_sheet.at("R1") == "/");
        CHECK(h.component_sheet.at("R2") == "/");
    }

    SECTION("nested sheets") {
        TargetCircuit t;
        t.components = {resistor("R1", "1k", "A", "B"), resistor("R2", "1k", "B", "C"),
                        resistor("R3", "1k", "C", "D")};
        t.sheets = {sheet("/power/ldo", "/power", {"R2"}),
                    sheet("/", "", {"R1"}),
                    sheet("/power", "/")};

        auto h = build_sheet_hierarchy(t);
        CHECK(h.errors.empty());
        REQUIRE(h.roots.size() == 1);
        CHECK(h.nodes().size() == 3);

        auto* ldo = h.find("/power/ldo");
        REQUIRE(ldo);
        CHECK(ldo->depth() == 2);
        CHECK(ldo->parent()->name() == "/power");
        CHECK(h.component_sheet.at("R2") == "/power/ldo");
        CHECK(h.component_sheet.at("R3") == "/");
    }

    SECTION("unknown parent") {
        TargetCircuit t;
        t.sheets = {sheet("/", ""), sheet("/orphan", "/missing"), sheet("/orphan/sub", "/orphan")};

        auto h = build_sheet_hierarchy(t);
        REQUIRE(h.roots.size() == 1);
        CHECK(h.find("/orphan") == nullptr);
        CHECK(h.errors.at("/orphan") == "unknown parent sheet '/missing'");
        CHECK(h.errors.at("/orphan/sub") == "ancestor sheet '/orphan' is malformed");
    }

    SECTION("cycle") {
        TargetCircuit t;
        t.sheets = {sheet("/", ""), sheet("/a", "/b"), sheet("/b", "/a"), sheet("/c", "/")};

        auto h = build_sheet_hierarchy(t);
        CHECK(h.errors.at("/a") == "cyclic sheet reference");
        CHECK(h.errors.at("/b") == "cyclic sheet reference");
        CHECK(h.errors.count("/c") == 0);
        CHECK(h.find("/c") != nullptr);
    }

    SECTION("duplicate names") {
        TargetCircuit t;
        t.sheets = {sheet("/", ""), sheet("/io", "/"), sheet("/io", "/")};

        auto h = build_sheet_hierarchy(t);
        CHECK(h.errors.at("/io") == "duplicate sheet name");
        CHECK(h.find("/io") == nullptr);
        CHECK(h.find("/") != nullptr);
    }

    SECTION("component listed on two sheets") {
        TargetCircuit t;
        t.components = {resistor("R1", "1k", "A", "B")};
        t.sheets = {sheet("/", "", {"R1"}), sheet("/io", "/", {"R1"})};

        auto h = build_sheet_hierarchy(t);
        CHECK(h.errors.empty());
        CHECK(h.component_sheet.at("R1") == "/");
        REQUIRE(h.warnings.size() == 1);
        CHECK(h.warnings[0].find("R1") != std::string::npos);
        CHECK(h.warnings[0].find("/io") != std::string::npos);
    }

    SECTION("multiple roots") {
        TargetCircuit t;
        t.sheets = {sheet("/main", ""), sheet("/aux", "")};

        auto h = build_sheet_hierarchy(t);
        CHECK(h.roots.size() == 2);
        CHECK(h.errors.empty());
    }
}
