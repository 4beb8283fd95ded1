#include "HostCommandResolver.h"
#include "../core/Logging.h"
#include <sstream>
#include <vector>

namespace sku_scan {

HostCommandResolver::HostCommandResolver(const Config& cfg, CommandRunner& runner, RemoteProbe& fallback)
    : config_(cfg), runner_(runner), fallback_(fallback) {}

HostCommandResolver::Parsed HostCommandResolver::parse_output(const std::string& text, const std::string& domain){
    Parsed p;
    // "5.0.0.10.in-addr.arpa domain name pointer box.local."
    std::istringstream iss(text);
    std::vector<std::string> words;
    std::string w;
    while(iss >> w) words.push_back(w);
    if(words.size() < 5) return p;

    std::string fqdn = words.back();
    if(!fqdn.empty() && fqdn.back() == '.') fqdn.pop_back();
    std::vector<std::string> labels;
    std::string cur;
    for(char c : fqdn){ if(c == '.'){ labels.push_back(cur); cur.clear(); } else cur.push_back(c); }
    labels.push_back(cur);

    if(labels.back() == domain){
        // bare "<domain>." carries no host label
        if(labels.size() < 2) return p;
        p.kind = Parsed::Kind::InDomain;
        p.name = labels[labels.size() - 2];
        return p;
    }
    if(labels.front() == "_gateway") return p;
    p.kind = Parsed::Kind::NeedsFallback;
    p.name = fqdn;
    return p;
}

std::optional<std::string> HostCommandResolver::resolve(const std::string& ip){
    auto& log = Logger::instance();
    CommandResult r = runner_.run({"host", "-W1", ip}, config_.resolve_timeout);
    if(r.timed_out){
        log.debug(ip + ": host timed out");
        return std::nullopt;
    }
    if(!r.ok()){
        log.debug(ip + ": host exited with code " + std::to_string(r.exit_code));
        return std::nullopt;
    }

    Parsed p = parse_output(r.output, config_.domain);
    switch(p.kind){
        case Parsed::Kind::InDomain:
            return p.name;
        case Parsed::Kind::Unpublishable:
            return std::string();
        case Parsed::Kind::NeedsFallback:
            break;
    }
    log.debug(ip + ": " + p.name + " is outside ." + config_.domain + ", falling back to /etc/hostname");
    auto fallback = fallback_.hostname(ip);
    return fallback ? *fallback : std::string();
}

}
