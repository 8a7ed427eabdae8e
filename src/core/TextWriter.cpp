#include "TextWriter.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <array>

namespace lan_scan {

std::string TextWriter::write(const ScanSummary& summary) const {
    const std::array<std::string,5> headers = {"IP", "HOSTNAME", "MAC", "TYPE", "SEEN"};
    std::array<size_t,5> widths{};
    for(size_t i = 0; i < headers.size(); ++i) widths[i] = headers[i].size();
    for(const auto& d : summary.devices){
        widths[0] = std::max(widths[0], d.ip.size());
        widths[1] = std::max(widths[1], d.hostname.size());
        widths[2] = std::max(widths[2], d.mac.size());
        widths[3] = std::max(widths[3], d.device_type.size());
        widths[4] = std::max(widths[4], d.scan_time.size());
    }
    std::ostringstream os;
    auto row = [&](const std::array<std::string,5>& cols){
        for(size_t i = 0; i < cols.size(); ++i){
            if(i + 1 < cols.size()) os << std::left << std::setw(static_cast<int>(widths[i] + 2)) << cols[i];
            else os << cols[i];
        }
        os << '\n';
    };
    os << "Network range: " << summary.network_range;
    if(!summary.local_ip.empty()) os << " (local " << summary.local_ip << ")";
    os << " - " << summary.scan_mode << "\n\n";
    row(headers);
    for(const auto& d : summary.devices) row({d.ip, d.hostname, d.mac, d.device_type, d.scan_time});
    os << '\n' << (summary.cancelled ? "Scan cancelled" : "Scan completed")
       << " - found " << summary.devices.size() << " devices, probed "
       << summary.hosts_probed << "/" << summary.hosts_total << " hosts in "
       << std::fixed << std::setprecision(1) << elapsed_seconds(summary) << "s\n";
    return os.str();
}

}
