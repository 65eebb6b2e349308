#pragma once

#include <spdlog/common.h>
#include <string>

namespace xorgconf::cfg {
struct GeneralSection;
}

namespace xorgconf::logging {

// Console logging on stderr until the configuration is loaded
void init_bootstrap_logging(spdlog::level::level_enum level = spdlog::level::info);

// Switch to the logger the [general] section asks for
void init_spdlog(const cfg::GeneralSection &general_section);

// Throws std::invalid_argument for unknown names
spdlog::level::level_enum parse_priority(const std::string &priority);
int parse_facility(const std::string &facility);

} // namespace xorgconf::logging
