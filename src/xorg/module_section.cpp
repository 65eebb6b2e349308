#include "sections.hpp"

namespace xorgconf {

module_section::module_section()
    : section{section_type::module}
{ }


entries_type module_section::entries() const
{
    return {
        {"Load", load_},
        {"Disable", disable_},
    };
}


module_section &module_section::set_load(std::vector<std::string> modules)
{
    load_ = std::move(modules);
    return *this;
}


module_section &module_section::add_load(std::string module)
{
    load_.push_back(std::move(module));
    return *this;
}


module_section &module_section::set_disable(std::vector<std::string> modules)
{
    disable_ = std::move(modules);
    return *this;
}


module_section &module_section::add_disable(std::string module)
{
    disable_.push_back(std::move(module));
    return *this;
}

} // namespace xorgconf
