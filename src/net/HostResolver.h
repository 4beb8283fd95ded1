#pragma once
#include <optional>
#include <string>

namespace sku_scan {

class HostResolver {
public:
    virtual ~HostResolver() = default;
    // nullopt: resolver failure or timeout.
    // "":      resolved, but not a name we publish (gateway, foreign domain).
    // other:   short hostname with the domain suffix stripped.
    virtual std::optional<std::string> resolve(const std::string& ip) = 0;
};

}
