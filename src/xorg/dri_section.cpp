#include "sections.hpp"

namespace xorgconf {

dri_section::dri_section()
    : section{section_type::dri}
{ }


entries_type dri_section::entries() const
{
    return {{"Mode", mode_}};
}


dri_section &dri_section::set_mode(std::optional<std::string> mode)
{
    mode_ = std::move(mode);
    return *this;
}

} // namespace xorgconf
