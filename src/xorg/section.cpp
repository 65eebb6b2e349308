#include "section.hpp"
#include "utils/string.hpp"
#include <array>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace xorgconf {

namespace {
constexpr std::array<std::pair<section_type, std::string_view>, 10> section_tags = {{
    {section_type::device, "Device"},
    {section_type::monitor, "Monitor"},
    {section_type::screen, "Screen"},
    {section_type::server_layout, "ServerLayout"},
    {section_type::input_device, "InputDevice"},
    {section_type::input_class, "InputClass"},
    {section_type::files, "Files"},
    {section_type::module, "Module"},
    {section_type::dri, "DRI"},
    {section_type::server_flags, "ServerFlags"},
}};
} // namespace


std::string_view to_string(section_type type)
{
    for (const auto &[t, tag]: section_tags)
        if (t == type)
            return tag;
    __builtin_unreachable();
}


section_type section_type_from_string(const std::string &tag)
{
    for (const auto &[t, name]: section_tags)
        if (utils::string::iequals(tag, std::string{name}))
            return t;
    throw std::invalid_argument(fmt::format("Invalid section type: {} (expected: Device, Monitor, Screen, ServerLayout, "
                                            "InputDevice, InputClass, Files, Module, DRI, ServerFlags)",
                                            tag));
}


section::section(section_type type)
    : type_{type}
{ }


std::optional<std::string> section::identifier() const
{
    return std::nullopt;
}


section &section::add_option(const std::string &name, value v)
{
    options_.set(name, std::move(v));
    return *this;
}


section &section::add_bool_option(const std::string &name, std::optional<bool> flag)
{
    options_.set_flag(name, flag);
    return *this;
}


const value &section::option(const std::string &name) const
{
    return options_.get(name);
}


section &section::set_options(option_store options)
{
    options_ = std::move(options);
    return *this;
}


section &section::add_custom_line(std::string line)
{
    custom_lines_.push_back(std::move(line));
    return *this;
}


section &section::set_custom_lines(std::vector<std::string> lines)
{
    custom_lines_ = std::move(lines);
    return *this;
}


std::vector<std::string> section::missing_fields() const
{
    return {};
}


void section::merge_options(option_store &) const
{ }


std::optional<std::string> section::render() const
{
    if (const auto missing = missing_fields(); !missing.empty()) {
        spdlog::debug("Section \"{}\" not renderable, missing: {}", tag(), utils::string::join(missing, ", "));
        return std::nullopt;
    }

    option_store merged = options_;
    merge_options(merged);

    std::string result = fmt::format("Section \"{}\"\n", tag());

    for (const auto &[name, val]: entries())
        result += render_entry(name, val);

    for (const auto &[name, val]: merged)
        result += render_option(name, val);

    for (const auto &line: custom_lines_)
        result += "  " + line + "\n";

    result += "EndSection\n";

    spdlog::debug("Section \"{}\" rendered ({} options, {} custom lines)", tag(), merged.size(),
                  custom_lines_.size());
    return result;
}


std::string section::render_entry(const std::string &name, const value &v)
{
    if (v.empty())
        return {};

    std::string result;
    if (v.is_list()) {
        for (const auto &element: v.as_list())
            result += fmt::format("  {} \"{}\"\n", name, element);
    } else {
        // booleans become "true"/"false", numbers are quoted like any other entry value
        result = fmt::format("  {} \"{}\"\n", name, v.to_string());
    }
    return result;
}


std::string section::render_option(const std::string &name, const value &v)
{
    switch (v.type()) {
    case value::kind::unset:
        return {};
    case value::kind::list: {
        std::string result;
        for (const auto &element: v.as_list())
            result += fmt::format("  Option \"{}\" \"{}\"\n", name, element);
        return result;
    }
    case value::kind::integer:
        return fmt::format("  Option \"{}\" {}\n", name, v.as_integer());
    case value::kind::string:
        if (v.as_string().empty())
            // flag-only option
            return fmt::format("  Option \"{}\"\n", name);
        return fmt::format("  Option \"{}\" \"{}\"\n", name, v.as_string());
    case value::kind::boolean:
    case value::kind::real:
        return fmt::format("  Option \"{}\" \"{}\"\n", name, v.to_string());
    }
    __builtin_unreachable();
}

} // namespace xorgconf
