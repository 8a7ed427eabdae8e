#pragma once
#include "Config.h"

namespace lan_scan {

class ConfigValidator {
public:
    // Normalizes cfg in place; false with a diagnostic on stderr on the
    // first invalid value.
    static bool validate(Config& cfg);
private:
    static bool validate_range(const Config& cfg);
    static bool validate_int(int value, int lo, int hi, const char* flag);
};

}
