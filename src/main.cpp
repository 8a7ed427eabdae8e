#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "core/Report.h"
#include "core/JSONWriter.h"
#include "core/CSVWriter.h"
#include "core/TextWriter.h"
#include "scan/ScanCoordinator.h"
#include "scan/NetworkRangeDetector.h"
#include "scan/PlatformProbe.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

using namespace lan_scan;

static std::atomic<bool> g_interrupted{false};

static void on_signal(int){ g_interrupted.store(true); }

static void install_signal_handlers(){
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static std::string render(const ScanSummary& summary, const Config& cfg){
    if(cfg.output_format == "json") return JSONWriter().write(summary, cfg);
    if(cfg.output_format == "csv") return CSVWriter().write(summary);
    return TextWriter().write(summary);
}

int main(int argc, char** argv) {
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    if(!ConfigValidator::validate(cfg)) return 2;
    Logger::instance().set_level(parse_log_level(cfg.log_level).value_or(LogLevel::Info));

    if(cfg.drop_priv) drop_capabilities(true);

    auto detector = std::make_shared<NetworkRangeDetector>();
    detector->register_all_default();

    NetworkInfo net;
    if(cfg.detect_only || cfg.network_range.empty()){
        try {
            net = detector->detect();
        } catch(const DetectionError& ex){
            std::cerr << "Network detection failed: " << ex.what() << "; pass --range CIDR\n";
            return 1;
        }
    }
    if(cfg.detect_only){
        std::cout << net.local_ip << " " << net.cidr << "\n";
        return 0;
    }

    ScanSummary summary;
    summary.network_range = cfg.network_range.empty() ? net.cidr : cfg.network_range;
    summary.local_ip = net.local_ip;
    summary.scan_mode = scan_mode_label(cfg);

    ProbeOptions options;
    options.timeout_seconds = cfg.timeout_seconds;
    options.attempts = effective_attempts(cfg);
    ScanCoordinator coordinator(make_platform_probe(), options, detector);

    install_signal_handlers();
    std::atomic<bool> scan_done{false};
    std::thread watcher([&]{
        while(!scan_done.load()){
            if(g_interrupted.load()){ coordinator.cancel(); break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    ProgressCallback on_progress;
    if(cfg.progress){
        on_progress = [](uint64_t done, uint64_t total){
            int pct = total ? static_cast<int>(done * 100 / total) : 100;
            std::cerr << "\rScanning: " << done << "/" << total << " (" << pct << "%)" << std::flush;
            if(done == total) std::cerr << "\n";
        };
    }
    DeviceCallback on_device = [](const DeviceRecord& d){
        Logger::instance().info("Device " + d.ip + " " + d.hostname + " " + d.mac + " " + d.device_type);
    };

    summary.start_time = std::chrono::system_clock::now();
    int rc = 0;
    try {
        summary.devices = coordinator.start_scan(summary.network_range, effective_threads(cfg), on_progress, on_device);
    } catch(const ScanConfigurationError& ex){
        std::cerr << "Invalid network range: " << ex.what() << "\n";
        rc = 2;
    }
    summary.end_time = std::chrono::system_clock::now();
    scan_done.store(true);
    watcher.join();
    if(rc != 0) return rc;

    auto stats = coordinator.last_stats();
    summary.network_range = stats.range;
    summary.hosts_total = stats.total;
    summary.hosts_probed = stats.completed;
    summary.cancelled = stats.cancelled;
    if(cfg.progress && summary.cancelled) std::cerr << "\n";

    std::string out = render(summary, cfg);
    if(cfg.output_file.empty()){
        std::cout << out;
    } else {
        std::ofstream ofs(cfg.output_file, std::ios::binary);
        if(!ofs || !(ofs << out)){
            std::cerr << "Failed to write output file: " << cfg.output_file << "\n";
            return 1;
        }
        Logger::instance().info("Report written to " + cfg.output_file);
    }
    return summary.cancelled && g_interrupted.load() ? 130 : 0;
}
