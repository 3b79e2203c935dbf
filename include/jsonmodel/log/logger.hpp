#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "jsonmodel/log/log_config.hpp"

namespace jsonmodel::log {

class Logger {
public:
    static void init(const LogConfig& config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string& level_str);
    static void set_level(LogConfig::LogLevel level);
};

}  // namespace jsonmodel::log

#define JSONMODEL_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define JSONMODEL_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define JSONMODEL_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define JSONMODEL_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define JSONMODEL_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define JSONMODEL_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
