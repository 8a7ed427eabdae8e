#include "ScanCoordinator.h"
#include "DeviceClassifier.h"
#include "../core/Logging.h"
#include <algorithm>
#include <thread>

namespace lan_scan {

ScanCoordinator::ScanCoordinator(PlatformProbePtr platform, ProbeOptions options, std::shared_ptr<NetworkRangeDetector> detector)
    : platform_(std::move(platform)), options_(options), detector_(std::move(detector)) {
    if(!detector_){
        detector_ = std::make_shared<NetworkRangeDetector>();
        detector_->register_all_default();
    }
}

NetworkInfo ScanCoordinator::detect_network() const {
    return detector_->detect();
}

void ScanCoordinator::cancel(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(active_ && !active_->cancelled()){
        Logger::instance().info("Cancelling scan of " + active_->range().to_string());
        active_->cancel();
    }
}

bool ScanCoordinator::scanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
}

ScanStats ScanCoordinator::last_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_stats_;
}

void ScanCoordinator::run_worker(ScanSession& session, const HostProbe& probe,
                                 const ProgressCallback& on_progress, const DeviceCallback& on_device) const {
    while(auto ip = session.next_target()){
        if(session.cancelled()) break;
        std::optional<DeviceRecord> record;
        try {
            if(auto res = probe.probe(*ip)){
                record = DeviceRecord{res->ip, res->hostname, res->mac,
                                      DeviceClassifier::classify(res->hostname, res->mac), res->scan_time};
                Logger::instance().debug("Found " + record->ip + " (" + record->hostname + ", " + record->mac + ") -> " + record->device_type);
            }
        } catch(const std::exception& ex){
            Logger::instance().warn("Probe of " + *ip + " failed: " + ex.what());
        }
        try {
            session.complete(std::move(record), on_progress, on_device);
        } catch(const std::exception& ex){
            Logger::instance().warn("Scan callback for " + *ip + " failed: " + ex.what());
        }
    }
}

std::vector<DeviceRecord> ScanCoordinator::start_scan(const std::optional<std::string>& range, int concurrency,
                                                      ProgressCallback on_progress, DeviceCallback on_device){
    std::string cidr = (range && !range->empty()) ? *range : detector_->detect().cidr;
    auto session = std::make_shared<ScanSession>(ScanRange::parse(cidr));

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        if(active_){
            Logger::instance().info("New scan supersedes active scan of " + active_->range().to_string());
            active_->cancel();
        }
        active_ = session;
    }

    HostProbe probe(*platform_, options_);
    uint64_t total = session->total();
    size_t workers = static_cast<size_t>(std::min<uint64_t>(static_cast<uint64_t>(std::max(concurrency, 1)), total));
    Logger::instance().info("Scanning " + session->range().to_string() + ": " + std::to_string(total) +
                            " hosts, " + std::to_string(workers) + " workers");

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for(size_t i = 0; i < workers; ++i){
        try {
            pool.emplace_back([&]{ run_worker(*session, probe, on_progress, on_device); });
        } catch(const std::exception& ex){
            Logger::instance().warn("Started only " + std::to_string(pool.size()) + " of " + std::to_string(workers) +
                                    " workers: " + ex.what());
            break;
        }
    }
    if(pool.empty() && total > 0) run_worker(*session, probe, on_progress, on_device);
    for(auto& t : pool) t.join();

    ScanStats stats{session->range().to_string(), total, session->completed(), session->cancelled()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(active_ == session) active_.reset();
        if(generation == generation_) last_stats_ = stats;
    }
    auto devices = session->devices();
    Logger::instance().info(std::string(stats.cancelled ? "Scan cancelled" : "Scan finished") + ": " +
                            std::to_string(devices.size()) + " devices, " + std::to_string(stats.completed) + "/" +
                            std::to_string(total) + " hosts probed");
    return devices;
}

}
