#pragma once
#include "RemoteProbe.h"
#include "../core/Config.h"
#include "../core/Subprocess.h"
#include <vector>

namespace sku_scan {

class SshRemoteProbe : public RemoteProbe {
public:
    SshRemoteProbe(const Config& cfg, CommandRunner& runner);

    std::optional<std::string> build_stamp(const std::string& ip) override;
    std::optional<std::string> bios_version(const std::string& ip) override;
    std::optional<std::string> kernel(const std::string& ip) override;
    std::optional<std::string> hostname(const std::string& ip) override;

    std::vector<std::string> command(const std::string& ip, const std::vector<std::string>& remote) const;
    // First line that is neither empty nor a '#' comment.
    static std::optional<std::string> first_stamp_line(const std::string& content);

private:
    std::optional<std::string> run_remote(const std::string& ip, const std::vector<std::string>& remote);

    const Config& config_;
    CommandRunner& runner_;
};

}
