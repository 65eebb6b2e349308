#include "logger/spdlog_init.hpp"

#include "cfg/config.hpp"
#include <map>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <syslog.h>

namespace xorgconf::logging {
namespace {
constexpr char SYSLOG_LOGGER_NAME[] = "xorgconf_syslog";
constexpr char CONSOLE_LOGGER_NAME[] = "xorgconf_console";
constexpr char SYSLOG_IDENT[] = "xorgconf-gen";

// stdout may carry the rendered configuration, so the console logger writes to stderr
std::shared_ptr<spdlog::logger> console_logger()
{
    auto logger = spdlog::get(CONSOLE_LOGGER_NAME);
    if (!logger)
        logger = spdlog::stderr_color_mt(CONSOLE_LOGGER_NAME);
    return logger;
}
} // namespace


spdlog::level::level_enum parse_priority(const std::string &priority)
{
    static const std::map<std::string, spdlog::level::level_enum> priority_map = {
        {"trace", spdlog::level::trace},  {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    };

    const auto it = priority_map.find(priority);
    if (it == priority_map.end())
        throw std::invalid_argument("Invalid log_priority: " + priority);
    return it->second;
}


int parse_facility(const std::string &facility)
{
    static const std::map<std::string, int> facility_map = {
        {"user", LOG_USER},     {"daemon", LOG_DAEMON}, {"auth", LOG_AUTH},     {"local0", LOG_LOCAL0},
        {"local1", LOG_LOCAL1}, {"local2", LOG_LOCAL2}, {"local3", LOG_LOCAL3}, {"local4", LOG_LOCAL4},
        {"local5", LOG_LOCAL5}, {"local6", LOG_LOCAL6}, {"local7", LOG_LOCAL7},
    };

    const auto it = facility_map.find(facility);
    if (it == facility_map.end())
        throw std::invalid_argument("Invalid log_facility: " + facility);
    return it->second;
}


void init_bootstrap_logging(spdlog::level::level_enum level)
{
    spdlog::set_default_logger(console_logger());
    spdlog::set_level(level);
}


void init_spdlog(const cfg::GeneralSection &general_section)
{
    const auto level = parse_priority(general_section.log_priority);

    if (general_section.log_type == "syslog") {
        const int facility = parse_facility(general_section.log_facility);

        spdlog::drop(SYSLOG_LOGGER_NAME);
        auto syslog_logger = spdlog::syslog_logger_mt(SYSLOG_LOGGER_NAME, SYSLOG_IDENT, LOG_PID, facility);
        spdlog::set_default_logger(syslog_logger);
    } else {
        spdlog::drop(SYSLOG_LOGGER_NAME);
        spdlog::set_default_logger(console_logger());
    }

    spdlog::set_level(level);
}

} // namespace xorgconf::logging
