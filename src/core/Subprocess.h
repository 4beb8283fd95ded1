#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace sku_scan {

struct CommandResult {
    int exit_code = -1; // -1 when the child did not exit normally
    bool timed_out = false;
    bool spawn_failed = false;
    std::string output; // captured stdout

    bool ok() const { return !timed_out && !spawn_failed && exit_code == 0; }
};

// Seam for every external tool invocation (arp-scan, host, ssh).
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

// fork/exec without a shell. stdin and stderr go to /dev/null, stdout is
// captured. A child still running at the deadline is killed together with
// its process group.
class SubprocessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;

    static constexpr size_t kMaxOutput = 1024 * 1024;
};

std::string join_argv(const std::vector<std::string>& argv);

}
