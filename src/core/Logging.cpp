#include "Logging.h"
#include "JsonUtil.h"
#include <chrono>
#include <iostream>

namespace sku_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(!enabled(lvl)) return;
    std::string stamp = jsonutil::time_to_iso(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << stamp << ' ' << prefix(lvl) << msg << '\n';
}

}
