#pragma once
#include <optional>
#include <string>

namespace sku_scan {

// Reads build metadata from a candidate device. Every call is independent
// and yields nullopt on failure or timeout.
class RemoteProbe {
public:
    virtual ~RemoteProbe() = default;
    virtual std::optional<std::string> build_stamp(const std::string& ip) = 0;
    virtual std::optional<std::string> bios_version(const std::string& ip) = 0;
    virtual std::optional<std::string> kernel(const std::string& ip) = 0;
    virtual std::optional<std::string> hostname(const std::string& ip) = 0;
};

}
