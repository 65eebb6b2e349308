#include "value.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace xorgconf {

bool value::empty() const
{
    switch (type()) {
    case kind::unset:
        return true;
    case kind::string:
        return as_string().empty();
    case kind::list:
        return as_list().empty();
    case kind::boolean:
    case kind::integer:
    case kind::real:
        return false;
    }
    __builtin_unreachable();
}


std::string value::to_string() const
{
    switch (type()) {
    case kind::string:
        return as_string();
    case kind::boolean:
        return as_bool() ? "true" : "false";
    case kind::integer:
        return fmt::format("{}", as_integer());
    case kind::real:
        // shortest representation that round-trips: 1.5 -> "1.5", 2.0 -> "2"
        return fmt::format("{}", as_real());
    case kind::unset:
        throw std::logic_error("Cannot stringify an unset value");
    case kind::list:
        throw std::logic_error("Cannot stringify a list value");
    }
    __builtin_unreachable();
}

} // namespace xorgconf
