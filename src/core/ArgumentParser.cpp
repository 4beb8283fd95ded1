#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <stdexcept>

namespace sku_scan {

const std::vector<ArgumentParser::FlagSpec>& ArgumentParser::specs() const {
    static const std::vector<FlagSpec> table = {
        {"--port", ArgKind::Int, "HTTP listen port (env PORT)", [](Config& c, const std::string& v){ c.port = std::stoi(v); }},
        {"--interface", ArgKind::String, "Network interface for arp-scan (env IF)", [](Config& c, const std::string& v){ c.interface = v; }},
        {"--ignore", ArgKind::CSV, "Comma-separated MACs to ignore (env IGNORE)", [](Config& c, const std::string& v){ c.ignore_macs = split_csv(v); }},
        {"--domain", ArgKind::String, "Local DNS domain (env SKU_SCAN_DOMAIN)", [](Config& c, const std::string& v){ c.domain = v; }},
        {"--ssh-user", ArgKind::String, "SSH user for device probes (env SKU_SCAN_SSH_USER)", [](Config& c, const std::string& v){ c.ssh_user = v; }},
        {"--no-sudo", ArgKind::None, "Run arp-scan without sudo", [](Config& c, const std::string&){ c.scan_sudo = false; }},
        {"--debug", ArgKind::None, "Verbose logging (env DEBUG)", [](Config& c, const std::string&){ c.debug = true; }},
    };
    return table;
}

void ArgumentParser::print_help() const {
    std::cout << "sku-scan options:\n";
    auto line = [](const std::string& name, const std::string& help){
        std::cout << "  " << name;
        for(size_t i = name.size(); i < 30; ++i) std::cout << ' ';
        std::cout << help << "\n";
    };
    for(const auto& s : specs()){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::CSV) name += " LIST";
        line(name, s.help);
    }
    line("--version", "Print version & exit");
    line("--help", "Show this help");
}

void ArgumentParser::print_version() const {
    std::cout << "sku-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--help"){ print_help(); return false; }
        if(a == "--version"){ print_version(); return false; }
        const FlagSpec* spec = nullptr;
        for(const auto& s : specs()) if(a == s.name) { spec = &s; break; }
        if(!spec){
            std::cerr << "Unknown arg: " << a << "\n";
            exit_code_ = 2;
            return false;
        }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i + 1 >= argc){
                std::cerr << "Missing value for " << a << "\n";
                exit_code_ = 2;
                return false;
            }
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const std::exception&) {
            std::cerr << "Invalid integer for " << a << ": " << val << "\n";
            exit_code_ = 2;
            return false;
        }
    }
    return true;
}

}
