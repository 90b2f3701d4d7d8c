#include <catch2/catch.hpp>

#include "netlist_xml.h"

using namespace schsync;

namespace {

const char* NETLIST = R"xml(<?xml version="1.0" encoding="utf-8"?>
<export version="E">
  <design>
    <source>/home/user/board/board.kicad_sch</source>
    <tool>Eeschema 7.0.10</tool>
    <sheet number="1" name="/" tstamps="/"/>
    <sheet number="2" name="/power/" tstamps="/4f1c/"/>
  </design>
  <components>
    <comp ref="R1">
      <value>10k</value>
      <footprint>Resistor_SMD:R_0603_1608Metric</footprint>
      <fields>
        <field name="Footprint">Resistor_SMD:R_0603_1608Metric</field>
        <field name="Tolerance">1%</field>
      </fields>
      <libsource lib="Device" part="R" description="Resistor"/>
      <sheetpath names="/" tstamps="/"/>
    </comp>
    <comp ref="U1">
      <value>AMS1117-3.3</value>
      <footprint>Package_TO_SOT_SMD:SOT-223-3_TabPin2</footprint>
      <libsource lib="Regulator_Linear" part="AMS1117-3.3"/>
      <sheetpath names="/power/" tstamps="/4f1c/"/>
    </comp>
    <comp ref="#PWR01">
      <value>GND</value>
      <libsource lib="power" part="GND"/>
      <sheetpath names="/power/" tstamps="/4f1c/"/>
    </comp>
  </components>
  <nets>
    <net code="1" name="VIN">
      <node ref="R1" pin="1" pintype="passive"/>
      <node ref="U1" pin="3" pintype="power_in"/>
    </net>
    <net code="2" name="GND">
      <node ref="U1" pin="1" pintype="power_in"/>
      <node ref="#PWR01" pin="1" pintype="power_in"/>
    </net>
    <net code="3" name="/power/+3V3">
      <node ref="U1" pin="2" pintype="power_out"/>
    </net>
    <net code="4" name="unconnected-(R1-Pad2)">
      <node ref="R1" pin="2" pintype="passive+no_connect"/>
    </net>
  </nets>
</export>
)xml";

} // namespace

TEST_CASE("KiCad XML netlist becomes a target circuit", "[netlist]") {
    NetlistXmlReader reader;
    TargetCircuit target;
    REQUIRE(reader.read_string(NETLIST, target));
    CHECK(reader.warnings().empty());

    SECTION("components") {
        REQUIRE(target.components.size() == 2);
        CHECK(target.find("#PWR01") == nullptr);

        auto* r1 = target.find("R1");
        REQUIRE(r1);
        CHECK(r1->symbol_id == "Device:R");
        CHECK(r1->value == "10k");
        CHECK(r1->footprint == "Resistor_SMD:R_0603_1608Metric");
        CHECK(r1->fields.at("Tolerance") == "1%");
        CHECK_FALSE(r1->has_id());
    }

    SECTION("pins") {
        auto* r1 = target.find("R1");
        auto* u1 = target.find("U1");
        REQUIRE(r1);
        REQUIRE(u1);
        CHECK(r1->pins.at("1") == "VIN");
        CHECK(r1->pins.at("2").empty());
        CHECK(u1->pins.at("1") == "GND");
        CHECK(u1->pins.at("2") == "/power/+3V3");
        CHECK(u1->pins.at("3") == "VIN");
    }

    SECTION("sheets") {
        REQUIRE(target.sheets.size() == 2);
        CHECK(target.sheets[0].name == "/");
        CHECK(target.sheets[0].parent_name.empty());
        CHECK(target.sheets[1].name == "/power");
        CHECK(target.sheets[1].parent_name == "/");
        CHECK(target.sheets[0].component_refs == std::vector<std::string>{"R1"});
        CHECK(target.sheets[1].component_refs == std::vector<std::string>{"U1"});
    }
}

TEST_CASE("Netlist reader options", "[netlist]") {
    NetlistReaderOptions opts;
    opts.skip_power_symbols = false;
    opts.keep_unconnected_nets = true;
    NetlistXmlReader reader(opts);
    TargetCircuit target;
    REQUIRE(reader.read_string(NETLIST, target));

    CHECK(target.components.size() == 3);
    REQUIRE(target.find("#PWR01"));
    CHECK(target.find("#PWR01")->pins.at("1") == "GND");
    CHECK(target.find("R1")->pins.at("2") == "unconnected-(R1-Pad2)");
}

TEST_CASE("Warnings name the net as written in the netlist", "[netlist]") {
    const char* xml = R"xml(<export version="E">
  <components>
    <comp ref="R1"><value>1k</value><libsource lib="Device" part="R"/></comp>
  </components>
  <nets>
    <net code="1" name="unconnected-(X9-Pad1)">
      <node ref="X9" pin="1"/>
    </net>
  </nets>
</export>)xml";

    NetlistXmlReader reader;
    TargetCircuit target;
    REQUIRE(reader.read_string(xml, target));
    REQUIRE(reader.warnings().size() == 1);
    CHECK(reader.warnings()[0] == "Net unconnected-(X9-Pad1) references unknown component X9");
}

TEST_CASE("Invalid netlists are rejected", "[netlist][error]") {
    TargetCircuit target;

    SECTION("not XML") {
        NetlistXmlReader reader;
        CHECK_FALSE(reader.read_string("<export><components></export>", target));
        CHECK_FALSE(reader.warnings().empty());
    }

    SECTION("wrong root element") {
        NetlistXmlReader reader;
        CHECK_FALSE(reader.read_string("<kicad_sch/>", target));
        REQUIRE(reader.warnings().size() == 1);
    }

    SECTION("no components") {
        NetlistXmlReader reader;
        CHECK_FALSE(reader.read_string("<export version=\"E\"><nets/></export>", target));
    }

    SECTION("missing file") {
        NetlistXmlReader reader;
        CHECK_FALSE(reader.read("/nonexistent/board.net", target));
    }
}

TEST_CASE("Sheet path helpers", "[netlist]") {
    CHECK(sheet_name_from_path("/") == "/");
    CHECK(sheet_name_from_path("") == "/");
    CHECK(sheet_name_from_path("/power/") == "/power");
    CHECK(sheet_name_from_path("/power/ldo/") == "/power/ldo");
    CHECK(sheet_name_from_path("power") == "/power");

    CHECK(parent_sheet_name("/power/ldo") == "/power");
    CHECK(parent_sheet_name("/power") == "/");
    CHECK(parent_sheet_name("/").empty());
}
