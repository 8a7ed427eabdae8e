#include "ScanRange.h"
#include "Errors.h"
#include "Utils.h"
#include <cctype>

namespace lan_scan {

std::optional<uint32_t> parse_ipv4(const std::string& text){
    uint32_t addr = 0; int octets = 0; size_t i = 0;
    while(octets < 4){
        if(i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
        unsigned value = 0; size_t digits = 0;
        while(i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))){
            value = value * 10 + static_cast<unsigned>(text[i] - '0');
            if(++digits > 3 || value > 255) return std::nullopt;
            ++i;
        }
        addr = (addr << 8) | value;
        ++octets;
        if(octets < 4){
            if(i >= text.size() || text[i] != '.') return std::nullopt;
            ++i;
        }
    }
    if(i != text.size()) return std::nullopt;
    return addr;
}

std::string format_ipv4(uint32_t addr){
    return std::to_string((addr >> 24) & 0xff) + "." + std::to_string((addr >> 16) & 0xff) + "." +
           std::to_string((addr >> 8) & 0xff) + "." + std::to_string(addr & 0xff);
}

uint32_t prefix_to_mask(int prefix){
    if(prefix <= 0) return 0;
    if(prefix >= 32) return 0xffffffffu;
    return 0xffffffffu << (32 - prefix);
}

std::optional<int> mask_to_prefix(uint32_t mask){
    int bits = 0;
    for(int octet = 0; octet < 4; ++octet){
        unsigned v = (mask >> (24 - 8 * octet)) & 0xff;
        while(v){ bits += static_cast<int>(v & 1u); v >>= 1; }
    }
    if(prefix_to_mask(bits) != mask) return std::nullopt;
    return bits;
}

std::optional<int> mask_to_prefix(const std::string& mask){
    auto m = parse_ipv4(utils::trim(mask));
    if(!m) return std::nullopt;
    return mask_to_prefix(*m);
}

std::string network_cidr(uint32_t addr, int prefix){
    return format_ipv4(addr & prefix_to_mask(prefix)) + "/" + std::to_string(prefix);
}

ScanRange::ScanRange(uint32_t network, int prefix)
    : network_(network & prefix_to_mask(prefix)), prefix_(prefix) {}

ScanRange ScanRange::parse(const std::string& text){
    std::string s = utils::trim(text);
    if(s.empty()) throw ScanConfigurationError("empty network range");
    std::string addr_part = s; int prefix = 32;
    size_t slash = s.find('/');
    if(slash != std::string::npos){
        addr_part = s.substr(0, slash);
        std::string pfx = s.substr(slash + 1);
        if(pfx.empty() || pfx.size() > 2) throw ScanConfigurationError("invalid prefix length in range: " + s);
        for(char c : pfx) if(!std::isdigit(static_cast<unsigned char>(c))) throw ScanConfigurationError("invalid prefix length in range: " + s);
        prefix = std::stoi(pfx);
        if(prefix > 32) throw ScanConfigurationError("prefix length out of range: " + s);
    }
    auto addr = parse_ipv4(addr_part);
    if(!addr) throw ScanConfigurationError("invalid IPv4 address in range: " + s);
    return ScanRange(*addr, prefix);
}

uint64_t ScanRange::host_count() const {
    uint64_t size = uint64_t{1} << (32 - prefix_);
    if(prefix_ >= 31) return size;
    return size - 2;
}

uint32_t ScanRange::host_at(uint64_t index) const {
    if(prefix_ >= 31) return network_ + static_cast<uint32_t>(index);
    return network_ + 1 + static_cast<uint32_t>(index);
}

}
