#pragma once
#include <memory>
#include <string>
#include <vector>

namespace sku_scan {

struct ScanEntry {
    std::string ip;
    std::string mac;
};

class ScanSource {
public:
    virtual ~ScanSource() = default;
    virtual std::string name() const = 0;
    // Devices answering on the segment right now. Empty on any failure.
    virtual std::vector<ScanEntry> scan() = 0;
};

using ScanSourcePtr = std::unique_ptr<ScanSource>;

}
