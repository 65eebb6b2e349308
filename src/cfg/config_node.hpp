#pragma once

#include "utils/string.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace xorgconf::cfg {

enum class NodeType {
    ROOT, // the whole file
    SECTION, // [name]
    VALUE // key = value
};

// One node of a parsed layout file. Children keep file order, which is also the order
// sections and options are rendered in.
struct ConfigNode {
    std::string key;
    std::string value;
    std::vector<ConfigNode> children;
    NodeType type = NodeType::VALUE;

    // First child named childKey, nullptr if there is none. Throws std::logic_error on a VALUE node.
    const ConfigNode *findChild(const std::string &childKey) const
    {
        if (!isContainer())
            throw std::logic_error(fmt::format("Cannot look up '{}' below key '{}': it holds a value", childKey, key));

        for (const auto &child: children)
            if (child.key == childKey)
                return &child;
        return nullptr;
    }

    // Value of the first child named childKey
    std::optional<std::string> findValue(const std::string &childKey) const
    {
        const ConfigNode *child = findChild(childKey);
        if (child == nullptr)
            return std::nullopt;
        return child->value;
    }

    // (suffix, value) of every child whose key starts with prefix, in file order.
    // "option.DPMS" with prefix "option." yields ("DPMS", value); the suffix may be empty.
    std::vector<std::pair<std::string, std::string>> childrenWithPrefix(const std::string &prefix) const
    {
        std::vector<std::pair<std::string, std::string>> result;
        for (const auto &child: children)
            if (child.key.compare(0, prefix.size(), prefix) == 0)
                result.emplace_back(child.key.substr(prefix.size()), child.value);
        return result;
    }

    bool isRoot() const { return type == NodeType::ROOT; }
    bool isSection() const { return type == NodeType::SECTION; }
    bool isValue() const { return type == NodeType::VALUE; }
    bool isContainer() const { return type == NodeType::ROOT || type == NodeType::SECTION; }
};

// --------------------------------------------------------------------------------
// Field conversion

// Surrounding whitespace is ignored; anything else around the number is an error ("24bpp").
template<typename T> T fromString(const std::string &str)
{
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else {
        T result;
        if (!boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(str), result))
            throw std::runtime_error(fmt::format("'{}' is not a valid number", str));
        return result;
    }
}

// Accepts the spellings xorg.conf itself uses for booleans
template<> inline bool fromString<bool>(const std::string &str)
{
    const std::string word = utils::string::to_lower(boost::algorithm::trim_copy(str));

    if (word == "true" || word == "1" || word == "yes" || word == "on")
        return true;
    if (word == "false" || word == "0" || word == "no" || word == "off")
        return false;
    throw std::runtime_error(fmt::format("'{}' is not a boolean (expected true/false, yes/no, on/off or 1/0)", str));
}

// --------------------------------------------------------------------------------
// Type traits

template<typename T> struct is_vector : std::false_type { };

template<typename U, typename Alloc> struct is_vector<std::vector<U, Alloc>> : std::true_type { };

template<typename T> struct is_optional : std::false_type { };

template<typename U> struct is_optional<std::optional<U>> : std::true_type { };

} // namespace xorgconf::cfg
