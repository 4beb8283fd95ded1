#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace sku_scan {

using Clock = std::chrono::steady_clock;

// Public fields of a classified device. Returned by value so callers never
// reach live table state through it.
struct Projection {
    std::string ip;
    std::string mac;
    std::string build_stamp;
    std::optional<std::string> bios_version;
    std::optional<std::string> kernel;
};

struct Device {
    std::string mac; // table key, never reassigned
    std::string ip;
    // unset = unresolved, "" = resolved but not publishable
    std::optional<std::string> hostname;
    std::optional<std::string> build_stamp;
    std::optional<std::string> bios_version;
    std::optional<std::string> kernel;
    Clock::time_point seen{};
    int tolerance = 0; // consecutive failed classification attempts

    bool is_sku() const { return build_stamp.has_value() && !build_stamp->empty(); }
    void touch(Clock::time_point now) { if(now > seen) seen = now; }
};

std::optional<Projection> project(const Device& device);

std::string describe(const Device& device);

}
