#include "ConfigValidator.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace sku_scan {

bool ConfigValidator::validate(Config& cfg) {
    if(cfg.port < 1 || cfg.port > 65535) {
        std::cerr << "Invalid port: " << cfg.port << " (expected 1-65535)\n";
        return false;
    }

    if(cfg.domain.empty()) {
        std::cerr << "Domain must not be empty\n";
        return false;
    }
    if(cfg.ssh_user.empty()) {
        std::cerr << "SSH user must not be empty\n";
        return false;
    }

    // Interface names are handed to arp-scan verbatim
    for(char c : cfg.interface) {
        if(std::isspace(static_cast<unsigned char>(c)) || c < 32 || c > 126) {
            std::cerr << "Interface name contains invalid character: " << cfg.interface << "\n";
            return false;
        }
    }

    if(!validate_positive(cfg.scan_period, "scan period")) return false;
    if(!validate_positive(cfg.device_ttl, "device ttl")) return false;
    if(!validate_positive(cfg.scan_timeout, "scan timeout")) return false;
    if(!validate_positive(cfg.resolve_timeout, "resolve timeout")) return false;
    if(!validate_positive(cfg.probe_timeout, "probe timeout")) return false;
    if(cfg.restart_delay.count() < 0) {
        std::cerr << "Restart delay must not be negative\n";
        return false;
    }
    if(cfg.max_tolerance < 0) {
        std::cerr << "Max tolerance must not be negative\n";
        return false;
    }

    normalize_ignore_list(cfg);
    return true;
}

std::string ConfigValidator::normalize_mac(const std::string& mac) {
    size_t start = mac.find_first_not_of(" \t\n\r");
    if(start == std::string::npos) return "";
    size_t end = mac.find_last_not_of(" \t\n\r");
    std::string out = mac.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

void ConfigValidator::normalize_ignore_list(Config& cfg) {
    std::vector<std::string> out;
    for(const auto& mac : cfg.ignore_macs) {
        std::string n = normalize_mac(mac);
        if(n.empty()) continue;
        if(std::find(out.begin(), out.end(), n) != out.end()) continue;
        out.push_back(n);
    }
    cfg.ignore_macs = std::move(out);
}

bool ConfigValidator::validate_positive(std::chrono::milliseconds value, const std::string& name) {
    if(value.count() <= 0) {
        std::cerr << "Invalid " << name << ": must be positive\n";
        return false;
    }
    return true;
}

} // namespace sku_scan
