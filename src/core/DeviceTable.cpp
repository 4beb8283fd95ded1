#include "DeviceTable.h"

namespace sku_scan {

std::optional<Device> DeviceTable::get(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if(it == devices_.end()) return std::nullopt;
    return it->second;
}

DeviceTable::UpsertResult DeviceTable::upsert(const std::string& mac, const std::string& ip, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if(it != devices_.end()) return {it->second, false};
    Device d;
    d.mac = mac;
    d.ip = ip;
    d.seen = now;
    auto inserted = devices_.emplace(mac, std::move(d));
    return {inserted.first->second, true};
}

bool DeviceTable::update(const std::string& mac, const std::function<void(Device&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if(it == devices_.end()) return false;
    fn(it->second);
    it->second.mac = it->first; // key is immutable
    return true;
}

std::vector<std::string> DeviceTable::evict_stale(Clock::time_point now, Clock::duration ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> removed;
    for(auto it = devices_.begin(); it != devices_.end(); ) {
        if(now - it->second.seen >= ttl) {
            removed.push_back(it->first);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<Device> DeviceTable::values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for(const auto& kv : devices_) out.push_back(kv.second);
    return out;
}

size_t DeviceTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

}
