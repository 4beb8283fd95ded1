#include "SshRemoteProbe.h"
#include "../core/Logging.h"
#include <sstream>

namespace sku_scan {

namespace {
std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}
}

SshRemoteProbe::SshRemoteProbe(const Config& cfg, CommandRunner& runner)
    : config_(cfg), runner_(runner) {}

std::vector<std::string> SshRemoteProbe::command(const std::string& ip, const std::vector<std::string>& remote) const {
    std::vector<std::string> args = {
        "ssh",
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "PasswordAuthentication=no",
        config_.ssh_user + "@" + ip,
    };
    args.insert(args.end(), remote.begin(), remote.end());
    return args;
}

std::optional<std::string> SshRemoteProbe::run_remote(const std::string& ip, const std::vector<std::string>& remote){
    auto& log = Logger::instance();
    CommandResult r = runner_.run(command(ip, remote), config_.probe_timeout);
    if(r.timed_out){
        log.debug(ip + ": ssh took too long to exit, killed");
        return std::nullopt;
    }
    if(!r.ok()){
        log.debug(ip + ": ssh exited with code " + std::to_string(r.exit_code));
        return std::nullopt;
    }
    return trim(r.output);
}

std::optional<std::string> SshRemoteProbe::first_stamp_line(const std::string& content){
    std::istringstream iss(content);
    std::string line;
    while(std::getline(iss, line)){
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(line.empty() || line[0] == '#') continue;
        return line;
    }
    return std::nullopt;
}

std::optional<std::string> SshRemoteProbe::build_stamp(const std::string& ip){
    auto content = run_remote(ip, {"cat", "/etc/buildstamp"});
    if(!content || content->empty()) return std::nullopt;
    return first_stamp_line(*content);
}

std::optional<std::string> SshRemoteProbe::bios_version(const std::string& ip){
    return run_remote(ip, {"cat", "/sys/class/dmi/id/bios_version"});
}

std::optional<std::string> SshRemoteProbe::kernel(const std::string& ip){
    return run_remote(ip, {"uname", "-r"});
}

std::optional<std::string> SshRemoteProbe::hostname(const std::string& ip){
    return run_remote(ip, {"cat", "/etc/hostname"});
}

}
