#include "DeviceClassifier.h"
#include "MacAddress.h"
#include "../core/Utils.h"

namespace lan_scan {

const std::vector<DeviceClassifier::KeywordRule>& DeviceClassifier::keyword_rules(){
    // order is the tie-break when several keyword sets match
    static const std::vector<KeywordRule> rules = {
        {{"router", "gateway", "fritzbox", "dlink", "asus", "tp-link"}, "Router"},
        {{"printer", "canon", "hp", "epson", "brother"}, "Printer"},
        {{"phone", "android", "iphone", "samsung", "huawei", "xiaomi"}, "Mobile Device"},
        {{"laptop", "notebook", "pc", "desktop", "macbook", "imac"}, "Computer"},
        {{"tv", "smart", "lg", "samsung-tv", "chromecast", "firetv"}, "Smart TV"},
        {{"raspberry", "pi"}, "Raspberry Pi"},
        {{"camera", "webcam", "cctv"}, "Camera"},
        {{"ap", "access point", "wifi"}, "Wireless AP"},
    };
    return rules;
}

const std::vector<std::pair<std::string,std::string>>& DeviceClassifier::vendor_table(){
    static const std::vector<std::pair<std::string,std::string>> vendors = {
        {"005056", "VMware"},
        {"080027", "VirtualBox"},
        {"000C29", "VMware"},
        {"001B21", "Intel"},
        {"00E04C", "Realtek"},
        {"B827EB", "Raspberry Pi"},
        {"DCA632", "Raspberry Pi"},
        {"00163E", "Xen Virtual"},
        {"525400", "QEMU/KVM"},
        {"FCFBFB", "Ubiquiti"},
        {"001A11", "Apple"},
        {"F0D1A9", "Samsung"},
    };
    return vendors;
}

std::string DeviceClassifier::vendor_for_prefix(const std::string& prefix){
    for(const auto& v : vendor_table()) if(v.first == prefix) return v.second;
    return "";
}

std::string DeviceClassifier::classify(const std::string& hostname, const std::string& mac){
    const std::string host = utils::to_lower(hostname);
    for(const auto& rule : keyword_rules()){
        for(const auto& kw : rule.keywords){
            if(host.find(kw) != std::string::npos) return rule.label;
        }
    }

    const std::string prefix = mac_vendor_prefix(mac);
    std::string vendor = vendor_for_prefix(prefix);
    if(!vendor.empty()){
        std::string v = utils::to_lower(vendor);
        if(v.find("vmware") != std::string::npos || v.find("virtual") != std::string::npos) return "Virtual Machine";
        return vendor;
    }

    if(prefix == "B827EB" || prefix == "DCA632" || host.find("raspberry") != std::string::npos) return "Raspberry Pi";
    return "Unknown Device";
}

}
