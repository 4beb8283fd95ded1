#include "DeviceWriter.h"
#include "JsonUtil.h"
#include <map>
#include <sstream>

namespace sku_scan {

using jsonutil::escape; using jsonutil::quote_or_null;

namespace {

void emit_projection(const Projection& p, std::ostream& os){
    os << "{\"ip\":\"" << escape(p.ip) << "\""
       << ",\"mac\":\"" << escape(p.mac) << "\""
       << ",\"buildStamp\":\"" << escape(p.build_stamp) << "\""
       << ",\"biosVersion\":" << quote_or_null(p.bios_version)
       << ",\"kernel\":" << quote_or_null(p.kernel)
       << "}";
}

}

bool DeviceWriter::wants_json(const std::string& accept){
    return accept.find("application/json") != std::string::npos;
}

std::string DeviceWriter::write_json(const std::vector<Device>& devices) const {
    // Same hostname twice: the later device wins
    std::map<std::string, Projection> by_host;
    for(const auto& d : devices){
        auto p = project(d);
        if(!p) continue;
        by_host[d.hostname.value_or("")] = std::move(*p);
    }
    std::ostringstream os;
    os << '{';
    bool first = true;
    for(const auto& kv : by_host){
        if(!first) os << ',';
        first = false;
        os << '"' << escape(kv.first) << "\":";
        emit_projection(kv.second, os);
    }
    os << '}';
    return os.str();
}

std::string DeviceWriter::write_text(const std::vector<Device>& devices) const {
    std::string out;
    bool first = true;
    for(const auto& d : devices){
        if(!d.is_sku()) continue;
        if(!first) out.push_back(',');
        first = false;
        out += d.hostname.value_or("");
    }
    return out;
}

}
