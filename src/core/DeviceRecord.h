#pragma once
#include <string>

namespace lan_scan {

constexpr const char* UNKNOWN_MAC = "Unknown";

// Result of one successful probe. Created once, never mutated afterwards.
struct DeviceRecord {
    std::string ip;
    std::string hostname; // IP string when reverse lookup fails
    std::string mac; // AA:BB:CC:DD:EE:FF or UNKNOWN_MAC
    std::string device_type;
    std::string scan_time; // local HH:MM:SS
};

// Local wall-clock time of day as HH:MM:SS.
std::string time_of_day_now();

}
