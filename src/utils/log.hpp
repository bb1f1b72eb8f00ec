//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_LOG_HPP
#define FIELDREL_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * @brief returns the logger registered under the given name, creating it on first use.
 *        all loggers share a single stderr sink.
 */
LoggerPtr createLogger(const std::string &name);

void setLogLevel(spdlog::level::level_enum level);

#endif //FIELDREL_LOG_HPP
