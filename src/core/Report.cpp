#include "Report.h"

namespace lan_scan {

double elapsed_seconds(const ScanSummary& summary){
    if(summary.end_time < summary.start_time) return 0.0;
    return std::chrono::duration<double>(summary.end_time - summary.start_time).count();
}

}
