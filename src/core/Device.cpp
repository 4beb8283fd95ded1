#include "Device.h"
#include <sstream>

namespace sku_scan {

std::optional<Projection> project(const Device& device){
    if(!device.is_sku()) return std::nullopt;
    Projection p;
    p.ip = device.ip;
    p.mac = device.mac;
    p.build_stamp = *device.build_stamp;
    p.bios_version = device.bios_version;
    p.kernel = device.kernel;
    return p;
}

std::string describe(const Device& device){
    auto opt = [](const std::optional<std::string>& v){ return v ? "'" + *v + "'" : std::string("null"); };
    std::ostringstream os;
    os << "{ mac: " << device.mac << ", ip: " << device.ip
       << ", hostname: " << opt(device.hostname)
       << ", buildStamp: " << opt(device.build_stamp)
       << ", biosVersion: " << opt(device.bios_version)
       << ", kernel: " << opt(device.kernel)
       << ", tolerance: " << device.tolerance
       << ", sku: " << (device.is_sku() ? "true" : "false") << " }";
    return os.str();
}

}
