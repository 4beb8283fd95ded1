#include "Classifier.h"
#include "Logging.h"

namespace sku_scan {

const char* to_string(ClassifyOutcome outcome){
    switch(outcome){
        case ClassifyOutcome::ResolveFailed: return "resolve-failed";
        case ClassifyOutcome::Unpublishable: return "unpublishable";
        case ClassifyOutcome::NotSku: return "not-sku";
        case ClassifyOutcome::Sku: return "sku";
        case ClassifyOutcome::Vanished: return "vanished";
    }
    return "unknown";
}

Classifier::Classifier(DeviceTable& table, HostResolver& resolver, RemoteProbe& probe, TimeSource now)
    : table_(table), resolver_(resolver), probe_(probe), now_(std::move(now)) {}

void Classifier::record_failure(const std::string& mac){
    table_.update(mac, [&](Device& d){ d.touch(now_()); ++d.tolerance; });
}

ClassifyOutcome Classifier::classify(const std::string& mac, const std::string& ip){
    auto hostname = resolver_.resolve(ip);
    if(!hostname){
        if(!table_.update(mac, [&](Device& d){ d.touch(now_()); ++d.tolerance; })) return ClassifyOutcome::Vanished;
        return ClassifyOutcome::ResolveFailed;
    }
    if(hostname->empty()){
        if(!table_.update(mac, [&](Device& d){ d.touch(now_()); d.hostname = std::string(); })) return ClassifyOutcome::Vanished;
        return ClassifyOutcome::Unpublishable;
    }

    // Hostname is kept even if the device turns out not to be a SKU
    if(!table_.update(mac, [&](Device& d){ d.hostname = hostname; })) return ClassifyOutcome::Vanished;

    auto stamp = probe_.build_stamp(ip);
    ClassifyOutcome outcome = ClassifyOutcome::NotSku;
    std::optional<std::string> bios, kernel;
    if(stamp && !stamp->empty()){
        bios = probe_.bios_version(ip);
        kernel = probe_.kernel(ip);
        outcome = ClassifyOutcome::Sku;
    }
    bool present = table_.update(mac, [&](Device& d){
        d.touch(now_());
        if(outcome == ClassifyOutcome::Sku){
            d.build_stamp = stamp;
            d.bios_version = bios;
            d.kernel = kernel;
            d.tolerance = 0;
        } else {
            ++d.tolerance;
        }
    });
    if(!present) return ClassifyOutcome::Vanished;

    auto& log = Logger::instance();
    if(log.enabled(LogLevel::Debug)){
        if(auto d = table_.get(mac)) log.debug(describe(*d));
    }
    return outcome;
}

}
