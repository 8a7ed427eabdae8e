#include "MacAddress.h"
#include <regex>
#include <cctype>

namespace lan_scan {

std::optional<std::string> normalize_mac(const std::string& text){
    static const std::regex mac_re(R"(^([0-9A-Fa-f]{1,2})([:-])([0-9A-Fa-f]{1,2})\2([0-9A-Fa-f]{1,2})\2([0-9A-Fa-f]{1,2})\2([0-9A-Fa-f]{1,2})\2([0-9A-Fa-f]{1,2})$)");
    std::smatch m;
    if(!std::regex_match(text, m, mac_re)) return std::nullopt;
    std::string out; bool all_zero = true;
    for(int i : {1, 3, 4, 5, 6, 7}){
        std::string octet = m[i].str();
        if(octet.size() == 1) octet = "0" + octet;
        for(char& c : octet){
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if(c != '0') all_zero = false;
        }
        if(!out.empty()) out.push_back(':');
        out += octet;
    }
    if(all_zero) return std::nullopt;
    return out;
}

std::optional<std::string> find_first_mac(const std::string& text){
    // octet boundaries keep "aa:bb:cc:dd:ee:ff:00" style runs from matching mid-way
    static const std::regex mac_re(R"((^|[^0-9A-Fa-f:-])([0-9A-Fa-f]{1,2}([:-])[0-9A-Fa-f]{1,2}(\3[0-9A-Fa-f]{1,2}){4})(?![0-9A-Fa-f:-]))");
    auto begin = std::sregex_iterator(text.begin(), text.end(), mac_re);
    for(auto it = begin; it != std::sregex_iterator(); ++it){
        if(auto mac = normalize_mac((*it)[2].str())) return mac;
    }
    return std::nullopt;
}

std::string mac_vendor_prefix(const std::string& mac){
    std::string hex;
    for(char c : mac){
        if(std::isxdigit(static_cast<unsigned char>(c))) hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        if(hex.size() == 6) return hex;
    }
    return "";
}

}
