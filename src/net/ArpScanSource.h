#pragma once
#include "ScanSource.h"
#include "../core/Config.h"
#include "../core/Subprocess.h"

namespace sku_scan {

class ArpScanSource : public ScanSource {
public:
    ArpScanSource(const Config& cfg, CommandRunner& runner);

    std::string name() const override { return "arp-scan"; }
    std::vector<ScanEntry> scan() override;

    std::vector<std::string> command() const;
    // Parses "<ip>\t<mac>" lines; anything else is skipped.
    static std::vector<ScanEntry> parse_output(const std::string& text);

private:
    const Config& config_;
    CommandRunner& runner_;
};

}
