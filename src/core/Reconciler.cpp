#include "Reconciler.h"
#include "ConfigValidator.h"
#include "Logging.h"
#include <algorithm>
#include <system_error>

namespace sku_scan {

const char* to_string(CycleState state){
    switch(state){
        case CycleState::Idle: return "idle";
        case CycleState::Scanning: return "scanning";
        case CycleState::Merging: return "merging";
        case CycleState::Probing: return "probing";
        case CycleState::Waiting: return "waiting";
    }
    return "unknown";
}

Reconciler::Reconciler(const Config& cfg, DeviceTable& table, ScanSource& source, Classifier& classifier, TimeSource now)
    : config_(cfg), table_(table), source_(source), classifier_(classifier), now_(std::move(now)) {
    for(const auto& mac : cfg.ignore_macs) ignore_.insert(ConfigValidator::normalize_mac(mac));
}

Reconciler::~Reconciler(){
    stop();
}

bool Reconciler::ignored(const std::string& mac) const {
    return !ignore_.empty() && ignore_.count(ConfigValidator::normalize_mac(mac)) > 0;
}

std::chrono::milliseconds Reconciler::next_delay(Clock::duration elapsed) const {
    auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    return std::max(std::chrono::milliseconds(0), config_.scan_period - spent);
}

std::vector<ProbeTarget> Reconciler::merge(const std::vector<ScanEntry>& snapshot, CycleStats& stats){
    auto& log = Logger::instance();
    std::vector<ProbeTarget> targets;
    std::unordered_set<std::string> macs;
    for(const auto& entry : snapshot){
        if(macs.count(entry.mac)) continue;
        if(ignored(entry.mac)){
            log.debug("Ignore: " + entry.mac);
            continue;
        }
        macs.insert(entry.mac);

        auto now = now_();
        auto up = table_.upsert(entry.mac, entry.ip, now);
        if(up.created){
            ++stats.added;
            targets.push_back({entry.mac, entry.ip});
            continue;
        }

        bool enqueue = false;
        std::string ip;
        table_.update(entry.mac, [&](Device& d){
            d.touch(now);
            if(d.ip != entry.ip){
                log.debug(entry.mac + " IP: " + d.ip + " -> " + entry.ip);
                d.ip = entry.ip;
            }
            ip = d.ip;
            enqueue = !d.is_sku() && d.tolerance <= config_.max_tolerance;
        });
        if(enqueue) targets.push_back({entry.mac, ip});
    }
    stats.observed = macs.size();
    return targets;
}

void Reconciler::probe_one(const ProbeTarget& target){
    try {
        ClassifyOutcome outcome = classifier_.classify(target.mac, target.ip);
        Logger::instance().debug(target.mac + " (" + target.ip + "): " + to_string(outcome));
    } catch(const std::exception& ex) {
        Logger::instance().error(target.mac + ": classification failed: " + ex.what());
        classifier_.record_failure(target.mac);
    }
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(target.mac);
}

void Reconciler::probe_all(const std::vector<ProbeTarget>& targets){
    std::vector<std::thread> workers;
    workers.reserve(targets.size());
    for(const auto& t : targets){
        {
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            if(!in_flight_.insert(t.mac).second){
                Logger::instance().warn(t.mac + " is already being classified, skipping");
                continue;
            }
        }
        try {
            workers.emplace_back(&Reconciler::probe_one, this, t);
        } catch(const std::system_error& ex) {
            Logger::instance().error("Cannot start classification for " + t.mac + ": " + ex.what());
            std::lock_guard<std::mutex> lock(in_flight_mutex_);
            in_flight_.erase(t.mac);
        }
    }
    // Barrier: the next cycle starts only after every probe of this one is done
    for(auto& w : workers) w.join();
}

CycleStats Reconciler::run_cycle(){
    auto& log = Logger::instance();
    CycleStats stats;
    auto t0 = now_();
    log.info("Scanning...");

    state_ = CycleState::Scanning;
    std::vector<ScanEntry> snapshot;
    try {
        snapshot = source_.scan();
    } catch(const std::exception& ex) {
        log.warn(source_.name() + " failed: " + ex.what());
    }

    state_ = CycleState::Merging;
    for(const auto& mac : table_.evict_stale(now_(), config_.device_ttl)){
        log.info("Device gone: " + mac);
        ++stats.evicted;
    }
    auto targets = merge(snapshot, stats);

    state_ = CycleState::Probing;
    stats.probed = targets.size();
    probe_all(targets);

    stats.elapsed = now_() - t0;
    state_ = CycleState::Idle;
    ++cycles_;
    return stats;
}

void Reconciler::run(){
    auto& log = Logger::instance();
    while(running_){
        std::chrono::milliseconds delay = config_.scan_period;
        try {
            CycleStats stats = run_cycle();
            delay = next_delay(stats.elapsed);
        } catch(const std::exception& ex) {
            log.error(std::string("Reconciliation cycle failed: ") + ex.what());
        }
        log.info("Scan done, next in " + std::to_string(delay.count()) + "ms");
        state_ = CycleState::Waiting;
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, delay, [this]{ return !running_; });
        state_ = CycleState::Idle;
    }
}

void Reconciler::start(){
    if(running_){
        Logger::instance().warn("Attempted to start already running reconciler");
        return;
    }
    running_ = true;
    thread_ = std::thread(&Reconciler::run, this);
}

void Reconciler::stop(){
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if(!running_ && !thread_.joinable()) return;
        running_ = false;
    }
    wait_cv_.notify_all();
    if(thread_.joinable()) thread_.join();
}

}
