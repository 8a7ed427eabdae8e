#include "Config.h"

namespace lan_scan {

bool is_deep_mode(const Config& cfg){ return cfg.scan_mode == "deep"; }

int effective_threads(const Config& cfg){
    if(cfg.threads > 0) return cfg.threads;
    return is_deep_mode(cfg) ? DEEP_SCAN_THREADS : FAST_SCAN_THREADS;
}

int effective_attempts(const Config& cfg){
    return is_deep_mode(cfg) ? cfg.deep_attempts : 1;
}

std::string scan_mode_label(const Config& cfg){
    return is_deep_mode(cfg) ? "Deep Scan" : "Fast Scan";
}

}
