#pragma once
#include "Config.h"
#include <string>

namespace sku_scan {

class ConfigValidator {
public:
    // Returns false (and prints the reason) when cfg cannot be used.
    bool validate(Config& cfg);

    static std::string normalize_mac(const std::string& mac);

private:
    void normalize_ignore_list(Config& cfg);
    bool validate_positive(std::chrono::milliseconds value, const std::string& name);
};

}
