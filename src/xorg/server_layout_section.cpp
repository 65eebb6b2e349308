#include "sections.hpp"

namespace xorgconf {

namespace {
// Identifiers of the referenced sections, in reference order.
template<typename T> value::list_type identifiers(const std::vector<const T *> &sections)
{
    value::list_type ids;
    ids.reserve(sections.size());
    for (const auto *s: sections) {
        if (s == nullptr)
            continue;
        if (auto id = s->identifier(); id && !id->empty())
            ids.push_back(std::move(*id));
    }
    return ids;
}
} // namespace


server_layout_section::server_layout_section(std::string identifier)
    : section{section_type::server_layout}, identifier_{std::move(identifier)}
{ }


std::vector<std::string> server_layout_section::missing_fields() const
{
    std::vector<std::string> missing;
    if (identifier_.empty())
        missing.emplace_back("Identifier");
    if (identifiers(screens_).empty())
        missing.emplace_back("Screen");
    return missing;
}


entries_type server_layout_section::entries() const
{
    return {
        {"Identifier", identifier_},
        {"Screen", identifiers(screens_)},
        {"InputDevice", identifiers(input_devices_)},
    };
}


server_layout_section &server_layout_section::set_identifier(std::string identifier)
{
    identifier_ = std::move(identifier);
    return *this;
}


server_layout_section &server_layout_section::add_screen(const screen_section &screen)
{
    screens_.push_back(&screen);
    return *this;
}


server_layout_section &server_layout_section::set_screens(std::vector<const screen_section *> screens)
{
    screens_ = std::move(screens);
    return *this;
}


server_layout_section &server_layout_section::add_input_device(const input_device_section &input_device)
{
    input_devices_.push_back(&input_device);
    return *this;
}


server_layout_section &
server_layout_section::set_input_devices(std::vector<const input_device_section *> input_devices)
{
    input_devices_ = std::move(input_devices);
    return *this;
}

} // namespace xorgconf
