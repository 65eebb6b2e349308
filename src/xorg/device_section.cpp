#include "sections.hpp"

namespace xorgconf {

device_section::device_section(std::string identifier, std::optional<std::string> driver)
    : section{section_type::device}, identifier_{std::move(identifier)}, driver_{std::move(driver)}
{ }


std::vector<std::string> device_section::missing_fields() const
{
    if (identifier_.empty())
        return {"Identifier"};
    return {};
}


entries_type device_section::entries() const
{
    return {
        {"Identifier", identifier_},
        {"Driver", driver_},
        {"BusID", bus_id_},
        {"Screen", screen_},
    };
}


device_section &device_section::set_identifier(std::string identifier)
{
    identifier_ = std::move(identifier);
    return *this;
}


device_section &device_section::set_driver(std::optional<std::string> driver)
{
    driver_ = std::move(driver);
    return *this;
}


device_section &device_section::set_bus_id(std::optional<std::string> bus_id)
{
    bus_id_ = std::move(bus_id);
    return *this;
}


device_section &device_section::set_screen(std::optional<int> screen)
{
    screen_ = screen;
    return *this;
}

} // namespace xorgconf
