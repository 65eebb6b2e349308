#include "sections.hpp"
#include <fmt/core.h>

namespace xorgconf {

monitor_section::monitor_section(std::string identifier)
    : section{section_type::monitor}, identifier_{std::move(identifier)}
{ }


std::vector<std::string> monitor_section::missing_fields() const
{
    if (identifier_.empty())
        return {"Identifier"};
    return {};
}


entries_type monitor_section::entries() const
{
    return {
        {"Identifier", identifier_},
        {"ModeLine", mode_lines_},
    };
}


void monitor_section::merge_options(option_store &options) const
{
    options.set("Primary", primary_);
    options.set("PreferredMode", preferred_mode_);
    options.set("LeftOf", left_of_);
    options.set("RightOf", right_of_);
    options.set("Above", above_);
    options.set("Below", below_);
    options.set("Enable", enable_);
    options.set("Ignore", ignore_);
    options.set("Rotate", rotate_);

    // a single coordinate is meaningless to the server
    if (position_x_ && position_y_)
        options.set("Position", fmt::format("{} {}", *position_x_, *position_y_));
}


monitor_section &monitor_section::set_identifier(std::string identifier)
{
    identifier_ = std::move(identifier);
    return *this;
}


monitor_section &monitor_section::set_mode_lines(std::vector<std::string> mode_lines)
{
    mode_lines_ = std::move(mode_lines);
    return *this;
}


monitor_section &monitor_section::add_mode_line(std::string mode_line)
{
    mode_lines_.push_back(std::move(mode_line));
    return *this;
}


monitor_section &monitor_section::set_primary(std::optional<bool> primary)
{
    primary_ = primary;
    return *this;
}


monitor_section &monitor_section::set_preferred_mode(std::optional<std::string> mode)
{
    preferred_mode_ = std::move(mode);
    return *this;
}


monitor_section &monitor_section::set_position(std::optional<int> x, std::optional<int> y)
{
    position_x_ = x;
    position_y_ = y;
    return *this;
}


monitor_section &monitor_section::set_left_of(std::optional<std::string> monitor)
{
    left_of_ = std::move(monitor);
    return *this;
}


monitor_section &monitor_section::set_right_of(std::optional<std::string> monitor)
{
    right_of_ = std::move(monitor);
    return *this;
}


monitor_section &monitor_section::set_above(std::optional<std::string> monitor)
{
    above_ = std::move(monitor);
    return *this;
}


monitor_section &monitor_section::set_below(std::optional<std::string> monitor)
{
    below_ = std::move(monitor);
    return *this;
}


monitor_section &monitor_section::set_enable(std::optional<bool> enable)
{
    enable_ = enable;
    return *this;
}


monitor_section &monitor_section::set_ignore(std::optional<bool> ignore)
{
    ignore_ = ignore;
    return *this;
}


monitor_section &monitor_section::set_rotate(std::optional<std::string> rotate)
{
    rotate_ = std::move(rotate);
    return *this;
}

} // namespace xorgconf
