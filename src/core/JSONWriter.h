#pragma once
#include "Report.h"
#include "Config.h"
#include <string>

namespace lan_scan {

class JSONWriter {
public:
    // {"scan_info":{...},"devices":[...]}; compact unless cfg.pretty.
    std::string write(const ScanSummary& summary, const Config& cfg) const;
};

}
