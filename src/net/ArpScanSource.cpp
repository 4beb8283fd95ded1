#include "ArpScanSource.h"
#include "../core/Logging.h"
#include <sstream>

namespace sku_scan {

ArpScanSource::ArpScanSource(const Config& cfg, CommandRunner& runner)
    : config_(cfg), runner_(runner) {}

std::vector<std::string> ArpScanSource::command() const {
    std::vector<std::string> args;
    if(config_.scan_sudo) args.push_back("sudo");
    args.push_back("arp-scan");
    args.push_back("-lx");
    args.push_back("-F");
    args.push_back("${ip}\t${mac}");
    if(!config_.interface.empty()){
        args.push_back("-I");
        args.push_back(config_.interface);
    }
    return args;
}

std::vector<ScanEntry> ArpScanSource::scan(){
    auto& log = Logger::instance();
    if(!config_.interface.empty()) log.debug("Using interface " + config_.interface);
    CommandResult r = runner_.run(command(), config_.scan_timeout);
    if(r.timed_out){
        log.debug("arp-scan timed out");
        return {};
    }
    if(!r.ok()){
        log.debug("arp-scan exited with code " + std::to_string(r.exit_code));
        return {};
    }
    return parse_output(r.output);
}

std::vector<ScanEntry> ArpScanSource::parse_output(const std::string& text){
    std::vector<ScanEntry> out;
    std::istringstream iss(text);
    std::string line;
    while(std::getline(iss, line)){
        if(!line.empty() && line.back() == '\r') line.pop_back();
        size_t tab = line.find('\t');
        if(tab == std::string::npos) continue;
        std::string ip = line.substr(0, tab);
        std::string mac = line.substr(tab + 1);
        size_t next = mac.find('\t');
        if(next != std::string::npos) mac.erase(next);
        if(ip.empty() || mac.empty()) continue;
        out.push_back({ip, mac});
    }
    return out;
}

}
