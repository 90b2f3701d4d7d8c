#pragma once

#include "circuit_model.h"
#include <string>
#include <vector>

// Forward declare pugixml types
namespace pugi {
class xml_node;
class xml_document;
}

namespace schsync {

struct NetlistReaderOptions {
    bool verbose = false;
    bool skip_power_symbols = true;     // "#PWR01", "#FLG02" carry no component
    bool keep_unconnected_nets = false; // "unconnected-(R1-Pad2)" as a real net
};

// Reads a KiCad XML netlist (eeschema "kicadxml" export) into a target circuit.
// Sheet names are the netlist's sheet paths without the trailing slash; the
// root sheet is "/".
class NetlistXmlReader {
public:
    explicit NetlistXmlReader(const NetlistReaderOptions& opts = {});

    // Returns true on success
    bool read(const std::string& filename, TargetCircuit& target);
    bool read_string(const std::string& xml_text, TargetCircuit& target);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    NetlistReaderOptions opts_;
    std::vector<std::string> warnings_;

    bool parse(const pugi::xml_document& doc, TargetCircuit& target);
    void parse_design(const pugi::xml_node& design, TargetCircuit& target);
    void parse_components(const pugi::xml_node& components, TargetCircuit& target);
    void parse_nets(const pugi::xml_node& nets, TargetCircuit& target);

    SheetSpec* sheet_for_path(const std::string& path, TargetCircuit& target);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

// "/power/ldo/" -> "/power/ldo", "/" -> "/"
std::string sheet_name_from_path(const std::string& path);

// "/power/ldo" -> "/power", "/power" -> "/", "/" -> ""
std::string parent_sheet_name(const std::string& name);

} // namespace schsync
