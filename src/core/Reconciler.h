#pragma once
#include "Classifier.h"
#include "Config.h"
#include "DeviceTable.h"
#include "../net/ScanSource.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_set>

namespace sku_scan {

enum class CycleState { Idle, Scanning, Merging, Probing, Waiting };

const char* to_string(CycleState state);

struct ProbeTarget {
    std::string mac;
    std::string ip;
};

struct CycleStats {
    size_t observed = 0; // distinct, non-ignored MACs in the snapshot
    size_t added = 0;
    size_t evicted = 0;
    size_t probed = 0;
    Clock::duration elapsed{};
};

// Drives scan -> evict -> merge -> probe -> join on its own thread and
// paces itself to cfg.scan_period. Only one cycle is ever active, and a
// cycle ends only after every classification it dispatched has finished.
class Reconciler {
public:
    Reconciler(const Config& cfg, DeviceTable& table, ScanSource& source, Classifier& classifier,
               TimeSource now = Clock::now);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    // One full cycle on the calling thread.
    CycleStats run_cycle();
    // Delay before the next cycle: period - elapsed, never negative.
    std::chrono::milliseconds next_delay(Clock::duration elapsed) const;

    CycleState state() const { return state_.load(); }
    uint64_t cycles() const { return cycles_.load(); }

private:
    void run();
    std::vector<ProbeTarget> merge(const std::vector<ScanEntry>& snapshot, CycleStats& stats);
    void probe_all(const std::vector<ProbeTarget>& targets);
    void probe_one(const ProbeTarget& target);
    bool ignored(const std::string& mac) const;

    const Config& config_;
    DeviceTable& table_;
    ScanSource& source_;
    Classifier& classifier_;
    TimeSource now_;
    std::unordered_set<std::string> ignore_;

    std::atomic<CycleState> state_{CycleState::Idle};
    std::atomic<uint64_t> cycles_{0};

    std::set<std::string> in_flight_;
    std::mutex in_flight_mutex_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}
