#include "sections.hpp"

namespace xorgconf {

namespace {
std::optional<std::string> identifier_of(const section *s)
{
    if (s == nullptr)
        return std::nullopt;
    return s->identifier();
}
} // namespace


screen_section::screen_section(std::string identifier)
    : section{section_type::screen}, identifier_{std::move(identifier)}
{ }


std::vector<std::string> screen_section::missing_fields() const
{
    std::vector<std::string> missing;
    if (identifier_.empty())
        missing.emplace_back("Identifier");
    // a reference to a section without identifier would render nothing
    if (const auto id = identifier_of(device_); !id || id->empty())
        missing.emplace_back("Device");
    if (const auto id = identifier_of(monitor_); !id || id->empty())
        missing.emplace_back("Monitor");
    return missing;
}


entries_type screen_section::entries() const
{
    return {
        {"Identifier", identifier_},
        {"Device", identifier_of(device_)},
        {"Monitor", identifier_of(monitor_)},
        {"DefaultDepth", default_depth_},
    };
}


void screen_section::merge_options(option_store &options) const
{
    options.set_flag("Accel", accel_);
}


screen_section &screen_section::set_identifier(std::string identifier)
{
    identifier_ = std::move(identifier);
    return *this;
}


screen_section &screen_section::set_device(const device_section &device)
{
    device_ = &device;
    return *this;
}


screen_section &screen_section::set_monitor(const monitor_section &monitor)
{
    monitor_ = &monitor;
    return *this;
}


screen_section &screen_section::set_default_depth(std::optional<int> depth)
{
    default_depth_ = depth;
    return *this;
}


screen_section &screen_section::set_accel(std::optional<bool> accel)
{
    accel_ = accel;
    return *this;
}

} // namespace xorgconf
