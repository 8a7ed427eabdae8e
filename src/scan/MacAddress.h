#pragma once
#include <string>
#include <optional>

namespace lan_scan {

// Canonical AA:BB:CC:DD:EE:FF form of a colon or hyphen separated MAC.
// Single-digit octets are zero padded. nullopt for malformed input and for
// the all-zero placeholder of incomplete neighbor entries.
std::optional<std::string> normalize_mac(const std::string& text);

// First well-formed 6-octet MAC anywhere in text, normalized.
std::optional<std::string> find_first_mac(const std::string& text);

// First three octets as six uppercase hex digits ("B827EB"); empty when
// fewer than six hex digits are present.
std::string mac_vendor_prefix(const std::string& mac);

}
