#pragma once
#include <string>

namespace lan_scan {

constexpr int FAST_SCAN_THREADS = 100;
constexpr int DEEP_SCAN_THREADS = 30;

struct Config {
    std::string network_range; // empty = auto-detect
    std::string scan_mode = "fast"; // fast | deep
    int threads = 0; // 0 = preset for scan_mode
    int timeout_seconds = 1; // per echo request
    int deep_attempts = 2; // echo attempts per host in deep mode
    std::string output_file; // empty = stdout
    std::string output_format = "table"; // table | csv | json
    bool pretty = false;
    bool compact = false; // wins over pretty
    bool progress = false; // progress line on stderr
    bool detect_only = false;
    std::string log_level = "info";
    bool drop_priv = false;
};

int effective_threads(const Config& cfg);
int effective_attempts(const Config& cfg);
bool is_deep_mode(const Config& cfg);
std::string scan_mode_label(const Config& cfg); // "Fast Scan" | "Deep Scan"

}
