#include "option_store.hpp"
#include <algorithm>

namespace xorgconf {

void option_store::set(const std::string &name, value v)
{
    if (!v.is_set())
        return;

    auto it = std::find_if(items_.begin(), items_.end(), [&name](const auto &item) { return item.first == name; });
    if (it != items_.end())
        it->second = std::move(v);
    else
        items_.emplace_back(name, std::move(v));
}


void option_store::set_flag(const std::string &name, std::optional<bool> flag)
{
    if (!flag)
        return;

    if (*flag)
        set(name, "");
    else
        set(name, false);
}


const value &option_store::get(const std::string &name) const
{
    static const value unset;
    for (const auto &[key, val]: items_)
        if (key == name)
            return val;
    return unset;
}


bool option_store::contains(const std::string &name) const
{
    return std::any_of(items_.begin(), items_.end(), [&name](const auto &item) { return item.first == name; });
}


bool option_store::erase(const std::string &name)
{
    auto it = std::find_if(items_.begin(), items_.end(), [&name](const auto &item) { return item.first == name; });
    if (it == items_.end())
        return false;
    items_.erase(it);
    return true;
}

} // namespace xorgconf
