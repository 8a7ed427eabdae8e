#pragma once
#include "DeviceRecord.h"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace lan_scan {

// Final outcome of one scan as handed to the writers.
struct ScanSummary {
    std::string network_range;
    std::string local_ip;
    std::string scan_mode; // display label, e.g. "Fast Scan"
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    uint64_t hosts_total = 0;
    uint64_t hosts_probed = 0;
    bool cancelled = false;
    std::vector<DeviceRecord> devices; // discovery order
};

double elapsed_seconds(const ScanSummary& summary);

}
