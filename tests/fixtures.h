#pragma once

#include "circuit_model.h"

#include <string>

namespace schsync::test {

inline ComponentRecord resistor(const std::string& ref, const std::string& value,
                                const std::string& net1, const std::string& net2) {
    return ComponentBuilder(ref)
        .symbol("Device:R")
        .value(value)
        .footprint("Resistor_SMD:R_0603_1608Metric")
        .pin("1", net1)
        .pin("2", net2)
        .build();
}

inline ComponentRecord capacitor(const std::string& ref, const std::string& value,
                                 const std::string& net1, const std::string& net2) {
    return ComponentBuilder(ref)
        .symbol("Device:C")
        .value(value)
        .footprint("Capacitor_SMD:C_0402_1005Metric")
        .pin("1", net1)
        .pin("2", net2)
        .build();
}

// Destination-side copy of a target record, as the codec would hand it over
inline ComponentRecord placed(ComponentRecord c, const std::string& id,
                              double x, double y, double rotation = 0.0) {
    c.id = id;
    c.position = {x, y};
    c.rotation = rotation;
    return c;
}

} // namespace schsync::test
