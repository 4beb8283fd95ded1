#pragma once
#include "Device.h"
#include <string>
#include <vector>

namespace sku_scan {

// Renders the public view of the device table. Devices that are not SKUs
// never show up in either format.
class DeviceWriter {
public:
    // {"<hostname>": {"ip":..,"mac":..,"buildStamp":..,"biosVersion":..,"kernel":..}, ...}
    std::string write_json(const std::vector<Device>& devices) const;
    // "host1,host2"
    std::string write_text(const std::vector<Device>& devices) const;

    static bool wants_json(const std::string& accept);
};

}
