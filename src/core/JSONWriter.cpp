#include "JSONWriter.h"
#include "JsonUtil.h"
#include <sstream>

namespace lan_scan {
namespace {

    using jsonutil::escape;

    void emit_device(const DeviceRecord& d, std::ostream& os) {
        os << "{\"ip\":\"" << escape(d.ip)
           << "\",\"hostname\":\"" << escape(d.hostname)
           << "\",\"mac\":\"" << escape(d.mac)
           << "\",\"device_type\":\"" << escape(d.device_type)
           << "\",\"scan_time\":\"" << escape(d.scan_time) << "\"}";
    }

    // Two-space indentation of compact JSON; [] and {} stay on one line.
    std::string pretty_print_json(const std::string& compact) {
        std::string out;
        out.reserve(compact.size() * 2);
        int depth = 0;
        bool in_string = false, esc = false;
        auto newline = [&]{ out.push_back('\n'); out.append(static_cast<size_t>(depth) * 2, ' '); };

        for (size_t i = 0; i < compact.size(); ++i) {
            char c = compact[i];
            if (in_string) {
                out.push_back(c);
                if (esc) esc = false;
                else if (c == '\\') esc = true;
                else if (c == '"') in_string = false;
                continue;
            }
            char next = i + 1 < compact.size() ? compact[i+1] : '\0';
            switch (c) {
                case '"': in_string = true; out.push_back(c); break;
                case '{': case '[':
                    out.push_back(c);
                    if (next == '}' || next == ']') { out.push_back(next); ++i; break; }
                    ++depth; newline();
                    break;
                case '}': case ']':
                    if (depth > 0) --depth;
                    newline(); out.push_back(c);
                    break;
                case ',': out.push_back(c); newline(); break;
                case ':': out.append(": "); break;
                default: out.push_back(c);
            }
        }
        out.push_back('\n');
        return out;
    }

}

std::string JSONWriter::write(const ScanSummary& summary, const Config& cfg) const {
    std::ostringstream os;
    os << "{\"scan_info\":{"
       << "\"timestamp\":\"" << jsonutil::time_to_iso_local(summary.end_time) << "\","
       << "\"network_range\":\"" << escape(summary.network_range) << "\","
       << "\"total_devices\":" << summary.devices.size() << ","
       << "\"scan_mode\":\"" << escape(summary.scan_mode) << "\"},"
       << "\"devices\":[";
    bool first = true;
    for (const auto& d : summary.devices) {
        if (!first) os << ',';
        first = false;
        emit_device(d, os);
    }
    os << "]}";
    std::string compact = os.str();
    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact + "\n";
}

}
