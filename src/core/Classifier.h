#pragma once
#include "DeviceTable.h"
#include "../net/HostResolver.h"
#include "../net/RemoteProbe.h"
#include <functional>

namespace sku_scan {

using TimeSource = std::function<Clock::time_point()>;

enum class ClassifyOutcome { ResolveFailed, Unpublishable, NotSku, Sku, Vanished };

const char* to_string(ClassifyOutcome outcome);

// One classification attempt for one device. Blocks on the resolver and
// the remote probe; all I/O happens outside the table lock.
class Classifier {
public:
    Classifier(DeviceTable& table, HostResolver& resolver, RemoteProbe& probe, TimeSource now = Clock::now);

    ClassifyOutcome classify(const std::string& mac, const std::string& ip);
    // Counts the attempt as a failed probe.
    void record_failure(const std::string& mac);

private:
    DeviceTable& table_;
    HostResolver& resolver_;
    RemoteProbe& probe_;
    TimeSource now_;
};

}
