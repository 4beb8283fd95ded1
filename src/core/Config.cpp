#include "Config.h"
#include "Logging.h"
#include <cstdlib>
#include <stdexcept>

namespace sku_scan {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c : s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

void load_env_config(Config& cfg, const EnvLookup& getenv_fn){
    auto get = [&](const char* k)->const char*{ const char* v = getenv_fn(k); return (v && *v) ? v : nullptr; };
    if(get("DEBUG")) cfg.debug = true;
    if(auto v = get("IF")) cfg.interface = v;
    if(auto v = get("IGNORE")) cfg.ignore_macs = split_csv(v);
    if(auto v = get("PORT")){
        try {
            size_t used = 0;
            int port = std::stoi(v, &used);
            if(used != std::string(v).size()) throw std::invalid_argument(v);
            cfg.port = port;
        } catch(const std::exception&) {
            Logger::instance().warn(std::string("Ignoring invalid PORT value: ") + v);
        }
    }
    if(auto v = get("SKU_SCAN_DOMAIN")) cfg.domain = v;
    if(auto v = get("SKU_SCAN_SSH_USER")) cfg.ssh_user = v;
    if(auto v = get("SKU_SCAN_SUDO")) cfg.scan_sudo = std::string(v) != "0";
}

void load_env_config(Config& cfg){
    load_env_config(cfg, [](const char* k){ return std::getenv(k); });
}

}
