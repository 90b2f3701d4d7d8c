#include "netlist_xml.h"
#include "utils.h"

#include <pugixml.hpp>
#include <iostream>
#include <map>

namespace schsync {

std::string sheet_name_from_path(const std::string& path) {
    std::string p = trim(path);
    if (p.empty() || p == "/") return "/";
    if (p.front() != '/') p = "/" + p;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

std::string parent_sheet_name(const std::string& name) {
    if (name.empty() || name == "/") return "";
    auto slash = name.rfind('/');
    if (slash == 0 || slash == std::string::npos) return "/";
    return name.substr(0, slash);
}

NetlistXmlReader::NetlistXmlReader(const NetlistReaderOptions& opts)
    : opts_(opts) {}

bool NetlistXmlReader::read(const std::string& filename, TargetCircuit& target) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        warn("Failed to parse XML: " + std::string(result.description()));
        return false;
    }
    return parse(doc, target);
}

bool NetlistXmlReader::read_string(const std::string& xml_text, TargetCircuit& target) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml_text.c_str());
    if (!result) {
        warn("Failed to parse XML: " + std::string(result.description()));
        return false;
    }
    return parse(doc, target);
}

bool NetlistXmlReader::parse(const pugi::xml_document& doc, TargetCircuit& target) {
    auto root = doc.child("export");
    if (!root) {
        warn("Not a KiCad netlist: missing <export> root element");
        return false;
    }

    log("Netlist version: " + std::string(root.attribute("version").as_string("unknown")));

    if (auto design = root.child("design")) {
        parse_design(design, target);
    }

    auto components = root.child("components");
    if (!components) {
        warn("No <components> section found");
        return false;
    }
    parse_components(components, target);

    if (auto nets = root.child("nets")) {
        parse_nets(nets, target);
    } else {
        warn("No <nets> section found, every pin is unconnected");
    }

    log("Parse complete: " + std::to_string(target.components.size()) + " components, " +
        std::to_string(target.sheets.size()) + " sheets");
    return true;
}

SheetSpec* NetlistXmlReader::sheet_for_path(const std::string& path, TargetCircuit& target) {
    std::string name = sheet_name_from_path(path);
    for (auto& s : target.sheets) {
        if (s.name == name) return &s;
    }

    // Ancestors first so parents are always listed before their children
    std::string parent = parent_sheet_name(name);
    if (!parent.empty()) sheet_for_path(parent, target);

    SheetSpec s;
    s.name = name;
    s.parent_name = parent;
    target.sheets.push_back(s);
    return &target.sheets.back();
}

void NetlistXmlReader::parse_design(const pugi::xml_node& design, TargetCircuit& target) {
    int count = 0;
    for (auto sheet : design.children("sheet")) {
        sheet_for_path(sheet.attribute("name").as_string("/"), target);
        count++;
    }
    log("Found " + std::to_string(count) + " sheets");
}

void NetlistXmlReader::parse_components(const pugi::xml_node& components, TargetCircuit& target) {
    int skipped = 0;
    for (auto comp : components.children("comp")) {
        std::string ref = comp.attribute("ref").as_string();
        if (ref.empty()) {
            warn("Component without a reference, skipped");
            continue;
        }
        if (opts_.skip_power_symbols && ref[0] == '#') {
            skipped++;
            continue;
        }
        if (target.find(ref)) {
            warn("Duplicate component reference " + ref + ", keeping the first");
            continue;
        }

        ComponentRecord rec;
        rec.reference = ref;
        rec.value = comp.child_value("value");
        rec.footprint = comp.child_value("footprint");

        auto lib = comp.child("libsource");
        std::string lib_name = lib.attribute("lib").as_string();
        std::string part = lib.attribute("part").as_string();
        rec.symbol_id = lib_name.empty() ? part : lib_name + ":" + part;

        for (auto field : comp.child("fields").children("field")) {
            std::string name = field.attribute("name").as_string();
            if (!name.empty()) rec.fields[name] = field.child_value();
        }

        std::string path = comp.child("sheetpath").attribute("names").as_string("/");
        SheetSpec* sheet = sheet_for_path(path, target);
        sheet->component_refs.push_back(ref);

        target.components.push_back(rec);
    }

    log("Parsed " + std::to_string(target.components.size()) + " components" +
        (skipped ? " (" + std::to_string(skipped) + " power symbols skipped)" : ""));
}

void NetlistXmlReader::parse_nets(const pugi::xml_node& nets, TargetCircuit& target) {
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < target.components.size(); ++i) {
        index[target.components[i].reference] = i;
    }

    int count = 0;
    for (auto net : nets.children("net")) {
        std::string label = net.attribute("name").as_string();
        bool unconnected = label.rfind("unconnected-", 0) == 0;
        std::string name = unconnected && !opts_.keep_unconnected_nets ? std::string() : label;
        if (!name.empty()) count++;

        for (auto node : net.children("node")) {
            std::string ref = node.attribute("ref").as_string();
            std::string pin = node.attribute("pin").as_string();
            auto it = index.find(ref);
            if (it == index.end()) {
                if (!(opts_.skip_power_symbols && !ref.empty() && ref[0] == '#')) {
                    warn("Net " + label + " references unknown component " + ref);
                }
                continue;
            }
            if (pin.empty()) {
                warn("Net " + label + " has a node on " + ref + " without a pin");
                continue;
            }
            target.components[it->second].pins[pin] = name;
        }
    }
    log("Found " + std::to_string(count) + " nets");
}

// --- Logging ---

void NetlistXmlReader::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[netlist] " << msg << std::endl;
    }
}

void NetlistXmlReader::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace schsync
