#include "ScanSession.h"

namespace lan_scan {

std::optional<std::string> ScanSession::next_target(){
    if(cancelled()) return std::nullopt;
    uint64_t index = next_.fetch_add(1);
    if(index >= total()) return std::nullopt;
    return format_ipv4(range_.host_at(index));
}

bool ScanSession::complete(std::optional<DeviceRecord> record, const ProgressCallback& on_progress, const DeviceCallback& on_device){
    std::lock_guard<std::mutex> lock(mutex_);
    if(cancelled()) return false;
    ++completed_;
    if(record){
        devices_.push_back(std::move(*record));
        if(on_device) on_device(devices_.back());
    }
    if(on_progress) on_progress(completed_, total());
    return true;
}

uint64_t ScanSession::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

std::vector<DeviceRecord> ScanSession::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

}
