#pragma once

#include <stdexcept>
#include <string>

namespace xorgconf::cfg {

class cfg_exception : public std::runtime_error {
public:
    explicit cfg_exception(const std::string &what)
        : runtime_error{what}
    { }
};

} // namespace xorgconf::cfg
