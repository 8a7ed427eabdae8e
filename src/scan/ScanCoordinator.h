#pragma once
#include "ScanSession.h"
#include "HostProbe.h"
#include "PlatformProbe.h"
#include "NetworkRangeDetector.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lan_scan {

struct ScanStats {
    std::string range;
    uint64_t total = 0;
    uint64_t completed = 0;
    bool cancelled = false;
};

// Runs cancellable scans over a bounded pool of worker threads. Starting a
// scan while another is active on the same coordinator cancels the older
// one (cancel-and-replace); the older call then returns what it gathered.
class ScanCoordinator {
public:
    explicit ScanCoordinator(PlatformProbePtr platform, ProbeOptions options = {},
                             std::shared_ptr<NetworkRangeDetector> detector = nullptr);

    // Blocks until every host is probed or the scan is cancelled, then
    // returns the records in discovery order. An empty range means the
    // detected local network. Throws ScanConfigurationError for an
    // unparsable range and DetectionError if detection is needed and fails.
    std::vector<DeviceRecord> start_scan(const std::optional<std::string>& range, int concurrency,
                                         ProgressCallback on_progress = {}, DeviceCallback on_device = {});

    // Idempotent; safe from any thread, including from callbacks.
    void cancel();
    bool scanning() const;
    // Stats of the most recently started scan that has finished; a
    // superseded scan never overwrites them.
    ScanStats last_stats() const;
    NetworkInfo detect_network() const;
private:
    void run_worker(ScanSession& session, const HostProbe& probe,
                    const ProgressCallback& on_progress, const DeviceCallback& on_device) const;

    PlatformProbePtr platform_;
    ProbeOptions options_;
    std::shared_ptr<NetworkRangeDetector> detector_;
    mutable std::mutex mutex_;
    std::shared_ptr<ScanSession> active_;
    uint64_t generation_ = 0; // scans started so far
    ScanStats last_stats_;
};

}
