#pragma once
#include <stdexcept>
#include <string>

namespace lan_scan {

// No strategy could determine the local network range.
class DetectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A supplied or derived CIDR block could not be parsed.
class ScanConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
