#pragma once
#include "HostResolver.h"
#include "RemoteProbe.h"
#include "../core/Config.h"
#include "../core/Subprocess.h"

namespace sku_scan {

// Reverse lookup through `host -W1 <ip>`, falling back to reading
// /etc/hostname from the device when the PTR name is outside the domain.
class HostCommandResolver : public HostResolver {
public:
    HostCommandResolver(const Config& cfg, CommandRunner& runner, RemoteProbe& fallback);

    std::optional<std::string> resolve(const std::string& ip) override;

    struct Parsed {
        enum class Kind { Unpublishable, InDomain, NeedsFallback } kind = Kind::Unpublishable;
        std::string name;
    };
    // Interprets the stdout of a successful `host` run.
    static Parsed parse_output(const std::string& text, const std::string& domain);

private:
    const Config& config_;
    CommandRunner& runner_;
    RemoteProbe& fallback_;
};

}
