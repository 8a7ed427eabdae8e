#pragma once
#include "Report.h"
#include <string>

namespace lan_scan {

// Column-aligned device table followed by a one-line summary.
class TextWriter {
public:
    std::string write(const ScanSummary& summary) const;
};

}
