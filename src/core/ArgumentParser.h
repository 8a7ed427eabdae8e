#pragma once
#include "Config.h"
#include <string>
#include <vector>
#include <functional>

namespace lan_scan {

class ArgumentParser {
public:
    ArgumentParser();
    // Returns false when the program should exit: --help/--version (after
    // printing) or an invalid command line (after a diagnostic on stderr).
    bool parse(int argc, char** argv, Config& cfg);
    bool exit_requested() const { return exit_requested_; }
    int exit_code() const { return exit_code_; }
    void print_help() const;
private:
    enum class ArgKind { None, String, Int };
    struct FlagSpec { const char* name; ArgKind kind; const char* help; std::function<void(Config&, const std::string&)> apply; };
    std::vector<FlagSpec> specs_;
    bool exit_requested_ = false;
    int exit_code_ = 0;
    const FlagSpec* find_spec(const std::string& flag) const;
};

}
