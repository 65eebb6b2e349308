#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xorgconf {

// Value of an entry or an option. Unset values never produce output.
class value {
public:
    using list_type = std::vector<std::string>;

    enum class kind { unset, string, boolean, integer, real, list };

    value() = default;
    value(std::string s)
        : data_{std::move(s)}
    { }
    // nullptr is unset
    value(const char *s)
    {
        if (s != nullptr)
            data_ = std::string{s};
    }
    value(bool b)
        : data_{b}
    { }
    value(int i)
        : data_{static_cast<long long>(i)}
    { }
    value(long i)
        : data_{static_cast<long long>(i)}
    { }
    value(long long i)
        : data_{i}
    { }
    value(unsigned int i)
        : data_{static_cast<long long>(i)}
    { }
    value(double d)
        : data_{d}
    { }
    value(list_type l)
        : data_{std::move(l)}
    { }

    template<typename T> value(const std::optional<T> &v)
    {
        if (v)
            *this = value(*v);
    }

    kind type() const { return static_cast<kind>(data_.index()); }

    bool is_set() const { return type() != kind::unset; }
    bool is_list() const { return type() == kind::list; }
    bool is_bool() const { return type() == kind::boolean; }
    bool is_integer() const { return type() == kind::integer; }

    // unset, "" and {} are empty; false and 0 are not
    bool empty() const;

    const std::string &as_string() const { return std::get<std::string>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    long long as_integer() const { return std::get<long long>(data_); }
    double as_real() const { return std::get<double>(data_); }
    const list_type &as_list() const { return std::get<list_type>(data_); }

    // Scalar text as it appears between the quotes. Throws std::logic_error for lists and unset values.
    std::string to_string() const;

    bool operator==(const value &other) const { return data_ == other.data_; }
    bool operator!=(const value &other) const { return !(*this == other); }

private:
    // alternative order matches enum kind
    std::variant<std::monostate, std::string, bool, long long, double, list_type> data_;
};

} // namespace xorgconf
