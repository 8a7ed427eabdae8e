#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace lan_scan {
namespace utils {

std::optional<std::string> read_file(const std::string& path, size_t max_bytes = 1024 * 1024);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

struct CommandResult {
    bool launched = false;  // false if pipe/fork failed
    int exit_status = -1;   // 127 when the program could not be executed
    std::string output;     // stdout and stderr interleaved
};

// Runs argv[0] from PATH without a shell, capturing up to max_output bytes.
CommandResult run_command(const std::vector<std::string>& argv, size_t max_output = 64 * 1024);

}
}
