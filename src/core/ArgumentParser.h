#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace port_census {

class ArgumentParser {
public:
    // Returns false when the caller should exit: --help, --version, or a usage error.
    // exit_code() tells the two apart (0 for help/version, 2 for usage errors).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    static void print_help();
    static void print_version();

private:
    enum class ArgKind { None, String, Int };
    struct FlagSpec { const char* name; ArgKind kind; std::function<bool(const std::string&)> apply; };
    std::vector<FlagSpec> build_specs(Config& cfg);
    int exit_code_ = 0;
};

}
