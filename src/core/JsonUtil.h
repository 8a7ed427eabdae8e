#pragma once
#include <string>
#include <chrono>

namespace lan_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// Local time, "YYYY-MM-DDTHH:MM:SS". Pinned to the epoch (UTC) when
// LAN_SCAN_CANON_TIME_ZERO is set.
std::string time_to_iso_local(std::chrono::system_clock::time_point tp);

}
}
