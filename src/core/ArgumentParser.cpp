#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace lan_scan {

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--range", ArgKind::String, "CIDR block to scan (default: auto-detect)", [](Config& c, const std::string& v){ c.network_range = v; }},
        {"--mode", ArgKind::String, "fast|deep scan preset", [](Config& c, const std::string& v){ c.scan_mode = v; }},
        {"--threads", ArgKind::Int, "Parallel probes (overrides mode preset)", [](Config& c, const std::string& v){ c.threads = std::stoi(v); }},
        {"--timeout", ArgKind::Int, "Echo timeout in seconds (1-10)", [](Config& c, const std::string& v){ c.timeout_seconds = std::stoi(v); }},
        {"--attempts", ArgKind::Int, "Echo attempts per host in deep mode (1-5)", [](Config& c, const std::string& v){ c.deep_attempts = std::stoi(v); }},
        {"--output", ArgKind::String, "Write report to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--format", ArgKind::String, "table|csv|json", [](Config& c, const std::string& v){ c.output_format = v; }},
        {"--pretty", ArgKind::None, "Indented JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, "Minified JSON (wins over --pretty)", [](Config& c, const std::string&){ c.compact = true; }},
        {"--progress", ArgKind::None, "Show progress on stderr", [](Config& c, const std::string&){ c.progress = true; }},
        {"--detect-only", ArgKind::None, "Print local address and network range, then exit", [](Config& c, const std::string&){ c.detect_only = true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--drop-priv", ArgKind::None, "Drop Linux capabilities except CAP_NET_RAW", [](Config& c, const std::string&){ c.drop_priv = true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help() const {
    std::cout << "lan-scan options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::Int) name += " N";
        std::cout << "  " << name;
        for(size_t i = name.size(); i < 24; ++i) std::cout << ' ';
        std::cout << ' ' << s.help << "\n";
    }
    std::cout << "  --version                 Print version & exit\n";
    std::cout << "  --help                    Show this help\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_requested_ = false; exit_code_ = 0;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i] ? argv[i] : "";
        if(a == "--help"){ print_help(); exit_requested_ = true; return false; }
        if(a == "--version"){
            std::cout << "lan-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
                      << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
                      << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            exit_requested_ = true; return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_requested_ = true; exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i + 1 >= argc || !argv[i+1]){ std::cerr << "Missing value for " << a << "\n"; exit_requested_ = true; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        try {
            if(spec->kind == ArgKind::Int){
                size_t used = 0; (void)std::stoi(val, &used);
                if(used != val.size()) throw std::invalid_argument(val);
            }
            spec->apply(cfg, val);
        } catch(const std::exception&){
            std::cerr << "Invalid integer for " << a << ": " << val << "\n";
            exit_requested_ = true; exit_code_ = 2;
            return false;
        }
    }
    return true;
}

}
