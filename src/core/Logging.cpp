#include "Logging.h"
#include <iostream>
#include <algorithm>

namespace port_census {

Logger& Logger::instance(){ static Logger inst; return inst; }

void Logger::set_level(LogLevel lvl){ std::lock_guard<std::mutex> lock(mutex_); level_ = lvl; }

const char* Logger::prefix(LogLevel lvl) const {
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
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << prefix(lvl) << msg << "\n";
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string s = name; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if(s=="error") out = LogLevel::Error;
    else if(s=="warn" || s=="warning") out = LogLevel::Warn;
    else if(s=="info") out = LogLevel::Info;
    else if(s=="debug") out = LogLevel::Debug;
    else if(s=="trace") out = LogLevel::Trace;
    else return false;
    return true;
}

}
