#pragma once
#include "value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace xorgconf {

// Options attached to a section. Iteration follows insertion order; setting an existing
// name replaces the value in place.
class option_store {
public:
    using item_type = std::pair<std::string, value>;
    // std::vector, because order is important
    using container_type = std::vector<item_type>;
    using const_iterator = container_type::const_iterator;

    // no-op for unset values
    void set(const std::string &name, value v);
    // true stores a valueless flag, false stores the boolean, unset is a no-op
    void set_flag(const std::string &name, std::optional<bool> flag);

    // returns an unset value when name is not present
    const value &get(const std::string &name) const;
    bool contains(const std::string &name) const;
    bool erase(const std::string &name);

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    void clear() { items_.clear(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

private:
    container_type items_;
};

} // namespace xorgconf
