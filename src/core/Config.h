#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>

namespace sku_scan {

struct Config {
    bool debug = false;
    std::string interface; // passed to arp-scan -I; empty = tool default
    std::vector<std::string> ignore_macs; // never enter the device table
    int port = 2991;
    std::string domain = "local"; // reverse DNS suffix accepted as a published name
    std::string ssh_user = "u";
    bool scan_sudo = true; // arp-scan needs raw sockets
    // Reconciliation policy
    std::chrono::milliseconds scan_period{10000};
    std::chrono::milliseconds device_ttl{60000};
    int max_tolerance = 5; // devices above this are no longer probed
    // Bounded waits for external tools
    std::chrono::milliseconds scan_timeout{30000};
    std::chrono::milliseconds resolve_timeout{3000};
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds restart_delay{5000};
};

Config& config();
void set_config(const Config& c);

using EnvLookup = std::function<const char*(const char*)>;

// Overlay DEBUG, IF, IGNORE, PORT and SKU_SCAN_* variables onto cfg.
void load_env_config(Config& cfg, const EnvLookup& getenv_fn);
void load_env_config(Config& cfg);

std::vector<std::string> split_csv(const std::string& s);

}
