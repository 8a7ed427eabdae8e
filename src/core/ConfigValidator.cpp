#include "ConfigValidator.h"
#include "ScanRange.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <iostream>

namespace lan_scan {

bool ConfigValidator::validate(Config& cfg){
    cfg.scan_mode = utils::to_lower(utils::trim(cfg.scan_mode));
    if(cfg.scan_mode != "fast" && cfg.scan_mode != "deep"){
        std::cerr << "Invalid --mode value: " << cfg.scan_mode << " (expected fast or deep)\n";
        return false;
    }

    cfg.output_format = utils::to_lower(utils::trim(cfg.output_format));
    if(cfg.output_format != "table" && cfg.output_format != "csv" && cfg.output_format != "json"){
        std::cerr << "Invalid --format value: " << cfg.output_format << "\n";
        return false;
    }

    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) cfg.pretty = false;

    if(cfg.threads != 0 && !validate_int(cfg.threads, 1, 200, "--threads")) return false;
    if(!validate_int(cfg.timeout_seconds, 1, 10, "--timeout")) return false;
    if(!validate_int(cfg.deep_attempts, 1, 5, "--attempts")) return false;

    if(!parse_log_level(cfg.log_level)){
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    return validate_range(cfg);
}

bool ConfigValidator::validate_int(int value, int lo, int hi, const char* flag){
    if(value < lo || value > hi){
        std::cerr << flag << " must be between " << lo << " and " << hi << " (got " << value << ")\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_range(const Config& cfg){
    if(cfg.network_range.empty()) return true;
    try {
        ScanRange::parse(cfg.network_range);
    } catch(const ScanConfigurationError& ex){
        std::cerr << "Invalid --range value: " << ex.what() << "\n";
        return false;
    }
    return true;
}

}
