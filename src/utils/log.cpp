//
// Created by fieldrel on 10/17/26.
//

#include "log.hpp"

#include <map>
#include <mutex>

inline auto initLoggerSink() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(spdlog::level::info);
    
    return sink;
}

std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> loggerSink = initLoggerSink();
std::map<std::string, LoggerPtr> loggerMap;
std::mutex loggerMutex;

LoggerPtr createLogger(const std::string &name) {
    std::scoped_lock lock(loggerMutex);

    auto it = loggerMap.find(name);
    if (it == loggerMap.end()) {
        auto logger = std::make_shared<spdlog::logger>(name, loggerSink);
        
        logger->set_level(loggerSink->level());
        it = loggerMap.emplace(name, std::move(logger)).first;
    }
    
    return it->second;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::scoped_lock lock(loggerMutex);
    loggerSink->set_level(level);
    
    for (auto &pair: loggerMap) {
        pair.second->set_level(level);
    }
}
