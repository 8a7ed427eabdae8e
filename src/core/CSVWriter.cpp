#include "CSVWriter.h"

namespace lan_scan {

std::string CSVWriter::quote_field(const std::string& field){
    if(field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for(char c : field){
        if(c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string CSVWriter::write(const ScanSummary& summary) const {
    std::string out = "ip,hostname,mac,device_type,scan_time\r\n";
    for(const auto& d : summary.devices){
        out += quote_field(d.ip); out += ',';
        out += quote_field(d.hostname); out += ',';
        out += quote_field(d.mac); out += ',';
        out += quote_field(d.device_type); out += ',';
        out += quote_field(d.scan_time); out += "\r\n";
    }
    return out;
}

}
