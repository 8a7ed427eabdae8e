#pragma once
#include <string>
#include <vector>
#include <utility>

namespace lan_scan {

// Heuristic device-type labelling from hostname keywords and MAC vendor
// prefix. Stateless; safe to call from any thread.
class DeviceClassifier {
public:
    static std::string classify(const std::string& hostname, const std::string& mac);

    struct KeywordRule { std::vector<std::string> keywords; std::string label; };
    static const std::vector<KeywordRule>& keyword_rules();
    static const std::vector<std::pair<std::string,std::string>>& vendor_table();
    // Vendor name for a six-hex-digit prefix, empty if not in the table.
    static std::string vendor_for_prefix(const std::string& prefix);
};

}
