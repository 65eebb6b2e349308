#pragma once
#include <stdexcept>
#include <string>

namespace xorgconf {

// A registered section could not be rendered because required fields are missing.
class render_exception : public std::runtime_error {
public:
    explicit render_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};


// The rendered document could not be persisted.
class write_exception : public std::runtime_error {
public:
    explicit write_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};

} // namespace xorgconf
