#pragma once
#include "Device.h"
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace sku_scan {

// MAC -> Device store shared by the reconciliation loop, the classification
// workers and the HTTP read path. Every call takes the table lock, so readers
// always see whole records.
class DeviceTable {
public:
    struct UpsertResult {
        Device device;
        bool created = false;
    };

    std::optional<Device> get(const std::string& mac) const;
    // Inserts a fresh entry when mac is unknown; an existing entry is
    // returned untouched.
    UpsertResult upsert(const std::string& mac, const std::string& ip, Clock::time_point now);
    // Applies fn to the stored record. False when mac is not present.
    bool update(const std::string& mac, const std::function<void(Device&)>& fn);
    // Removes every entry with now - seen >= ttl and returns their MACs.
    std::vector<std::string> evict_stale(Clock::time_point now, Clock::duration ttl = std::chrono::seconds(60));
    // Copy of all entries, ordered by MAC.
    std::vector<Device> values() const;
    size_t size() const;

private:
    std::map<std::string, Device> devices_;
    mutable std::mutex mutex_;
};

}
