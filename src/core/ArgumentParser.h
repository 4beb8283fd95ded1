#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace sku_scan {

class ArgumentParser {
public:
    // Returns false when the process should exit right away (help, version
    // or a bad flag); exit_code() then holds the status to exit with.
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help() const;
    void print_version() const;

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; const char* help; std::function<void(Config&, const std::string&)> apply; };
    const std::vector<FlagSpec>& specs() const;
    int exit_code_ = 0;
};

}
