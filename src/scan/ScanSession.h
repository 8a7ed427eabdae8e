#pragma once
#include "../core/DeviceRecord.h"
#include "../core/ScanRange.h"
#include <atomic>
#include <mutex>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>

namespace lan_scan {

using ProgressCallback = std::function<void(uint64_t completed, uint64_t total)>;
using DeviceCallback = std::function<void(const DeviceRecord&)>;

// State of one scan: the ordered worklist, the accumulated records, the
// completed counter and the cancellation flag. Shared by reference between
// the workers of a single start_scan call.
class ScanSession {
public:
    explicit ScanSession(ScanRange range) : range_(range) {}

    // Next address to probe, or nullopt once the worklist is drained or the
    // session is cancelled.
    std::optional<std::string> next_target();

    // Accounts for one finished probe and invokes the callbacks under the
    // session lock (so progress is delivered strictly increasing). Returns
    // false without counting anything once the session is cancelled.
    // Callbacks must not call back into this session.
    bool complete(std::optional<DeviceRecord> record, const ProgressCallback& on_progress, const DeviceCallback& on_device);

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    const ScanRange& range() const { return range_; }
    uint64_t total() const { return range_.host_count(); }
    uint64_t completed() const;
    std::vector<DeviceRecord> devices() const;
private:
    ScanRange range_;
    std::atomic<uint64_t> next_{0};
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    uint64_t completed_ = 0;
    std::vector<DeviceRecord> devices_;
};

}
