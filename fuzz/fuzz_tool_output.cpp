#include "net/ArpScanSource.h"
#include "net/HostCommandResolver.h"
#include "net/SshRemoteProbe.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    auto entries = sku_scan::ArpScanSource::parse_output(input);
    for (const auto& e : entries) {
        if (e.ip.empty() || e.mac.empty()) __builtin_trap();
    }
    auto parsed = sku_scan::HostCommandResolver::parse_output(input, "local");
    if (parsed.kind == sku_scan::HostCommandResolver::Parsed::Kind::Unpublishable && !parsed.name.empty()) {
        __builtin_trap();
    }
    auto stamp = sku_scan::SshRemoteProbe::first_stamp_line(input);
    if (stamp && (stamp->empty() || (*stamp)[0] == '#')) __builtin_trap();
    return 0;
}
