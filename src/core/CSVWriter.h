#pragma once
#include "Report.h"
#include <string>

namespace lan_scan {

// Header row then one CRLF-terminated row per device, RFC 4180 quoting.
class CSVWriter {
public:
    std::string write(const ScanSummary& summary) const;
    static std::string quote_field(const std::string& field);
};

}
