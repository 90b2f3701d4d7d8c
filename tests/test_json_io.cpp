#include <catch2/catch.hpp>

#include "json_io.h"
#include "project_sync.h"
#include "fixtures.h"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace schsync;
using namespace schsync::test;
using json = nlohmann::json;

namespace {

const char* TARGET_JSON = R"({
  "components": [
    {"reference": "R1", "symbol": "Device:R", "value": "10k",
     "footprint": "Resistor_SMD:R_0603_1608Metric",
     "pins": {"1": "VIN", "2": "MID"}, "fields": {"Tolerance": "1%"}},
    {"reference": "U1", "symbol": "Amplifier_Operational:LM358", "value": "LM358",
     "pins": {"1": "OUT", "2": null, "3": "MID"}}
  ],
  "sheets": [
    {"name": "/", "parent": null, "components": ["R1"]},
    {"name": "/amp", "parent": "/", "components": ["U1"]}
  ]
})";

const char* SNAPSHOT_JSON = R"({
  "sheets": [
    {"name": "/", "file": "board.kicad_sch", "tool_generated": false,
     "components": [
       {"uuid": "0b7f-r1", "reference": "R1", "symbol": "Device:R", "value": "4k7",
        "footprint": "Resistor_SMD:R_0603_1608Metric",
        "position": [50.8, 25.4], "rotation": -90,
        "pins": {"1": "VIN", "2": "MID"}, "fields": {"Note": "check"}}
     ],
     "artifacts": [
       {"kind": "wire", "uuid": "w1", "points": [[50.8, 21.59], [50.8, 10.16]]},
       {"kind": "power_symbol", "uuid": "p1", "text": "GND"}
     ]},
    {"name": "/amp", "file": "amp.kicad_sch"}
  ]
})";

} // namespace

TEST_CASE("Target circuit JSON", "[json]") {
    TargetCircuit target;
    REQUIRE(read_target_json(std::string(TARGET_JSON), target));

    REQUIRE(target.components.size() == 2);
    auto* r1 = target.find("R1");
    REQUIRE(r1);
    CHECK(r1->symbol_id == "Device:R");
    CHECK(r1->pins.at("2") == "MID");
    CHECK(r1->fields.at("Tolerance") == "1%");
    CHECK_FALSE(r1->has_id());

    // null marks an unconnected pin
    CHECK(target.find("U1")->pins.at("2").empty());

    REQUIRE(target.sheets.size() == 2);
    CHECK(target.sheets[0].parent_name.empty());
    CHECK(target.sheets[1].parent_name == "/");
    CHECK(target.sheets[1].component_refs == std::vector<std::string>{"U1"});
}

TEST_CASE("Destination snapshot JSON", "[json]") {
    SnapshotMap snaps;
    REQUIRE(read_snapshots_json(std::string(SNAPSHOT_JSON), snaps));
    REQUIRE(snaps.size() == 2);

    auto& root = snaps.at("/");
    CHECK(root.file == "board.kicad_sch");
    CHECK_FALSE(root.tool_generated);
    REQUIRE(root.components.size() == 1);
    CHECK(root.components[0].id == "0b7f-r1");
    CHECK(root.components[0].position == Point(50.8, 25.4));
    CHECK(root.components[0].rotation == Approx(270.0));

    REQUIRE(root.artifacts.size() == 2);
    CHECK(root.artifacts[0].kind == DestinationArtifact::WIRE);
    CHECK(root.artifacts[0].points.size() == 2);
    CHECK(root.artifacts[1].kind == DestinationArtifact::POWER_SYMBOL);
    CHECK(root.artifacts[1].text == "GND");

    CHECK(snaps.at("/amp").tool_generated);
    CHECK(snaps.at("/amp").components.empty());
}

TEST_CASE("Malformed JSON is reported, not thrown", "[json][error]") {
    TargetCircuit target;
    CHECK_FALSE(read_target_json(std::string("{\"components\": [}"), target));

    SnapshotMap snaps;
    CHECK_FALSE(read_snapshots_json(std::string("not json"), snaps));

    // Wrong value type
    CHECK_FALSE(read_target_json(std::string(R"({"components": [{"reference": 5}]})"), target));
}

TEST_CASE("Snapshots written back read the same", "[json]") {
    SnapshotMap snaps;
    REQUIRE(read_snapshots_json(std::string(SNAPSHOT_JSON), snaps));

    std::ostringstream out;
    write_snapshots_json(out, snaps);

    SnapshotMap again;
    REQUIRE(read_snapshots_json(out.str(), again));
    REQUIRE(again.size() == snaps.size());

    auto& a = snaps.at("/").components[0];
    auto& b = again.at("/").components[0];
    CHECK(a.id == b.id);
    CHECK(a.position == b.position);
    CHECK(a.rotation == Approx(b.rotation));
    CHECK(a.pins == b.pins);
    CHECK(a.fields == b.fields);
    CHECK(again.at("/").artifacts.size() == 2);
}

TEST_CASE("Merge plan JSON", "[json][plan]") {
    TargetCircuit target;
    REQUIRE(read_target_json(std::string(TARGET_JSON), target));
    SnapshotMap snaps;
    REQUIRE(read_snapshots_json(std::string(SNAPSHOT_JSON), snaps));

    ProjectInput input{target, snaps};
    SyncOptions opts;
    opts.mode = MatchMode::Identity;
    ProjectSynchronizer sync(opts);
    ProjectReport report;
    sync.sync(input, report);

    std::ostringstream out;
    write_plan_json(out, report);
    json j = json::parse(out.str());

    REQUIRE(j["sheets"].size() == 2);
    CHECK(j["totals"]["sheets"] == 2);
    CHECK(j["totals"]["added"] == 1);
    CHECK(j["structural_errors"].empty());
    CHECK(j["net_scopes"]["/"]["shared"] == json::array({"MID"}));

    json root;
    for (auto& s : j["sheets"]) {
        if (s["name"] == "/") root = s;
    }
    REQUIRE(root.is_object());
    CHECK(root["error"].is_null());
    REQUIRE(root["updates"].size() == 1);

    auto& u = root["updates"][0];
    CHECK(u["uuid"] == "0b7f-r1");
    CHECK(u["strategy"] == "reference");
    CHECK(u["position"] == json::array({50.8, 25.4}));
    CHECK(u["annotations"]["Note"] == "check");
    REQUIRE(u["deltas"].size() == 2);
    CHECK(u["deltas"][0]["field"] == "value");
    CHECK(u["deltas"][0]["new"] == "10k");
    CHECK(u["deltas"][1]["field"] == "fields");
    CHECK(u["deltas"][1]["key"] == "Tolerance");

    json amp;
    for (auto& s : j["sheets"]) {
        if (s["name"] == "/amp") amp = s;
    }
    REQUIRE(amp["additions"].size() == 1);
    CHECK(amp["additions"][0]["reference"] == "U1");
    CHECK(amp["additions"][0]["hint"].is_null());
    CHECK(amp["additions"][0]["proposed_uuid"].get<std::string>().size() == 36);
}
