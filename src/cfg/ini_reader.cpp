#include "ini_reader.hpp"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fmt/core.h>

namespace xorgconf::cfg {

namespace {
ConfigNode toConfigNode(const boost::property_tree::ptree &pt)
{
    ConfigNode root{"config", "", {}, NodeType::ROOT};

    for (const auto &[key, node]: pt) {
        // read_ini drops sections without keys, so a node without children is a global key.
        // A global key without a value cannot be told apart and ends up as an empty section.
        if (node.empty() && !node.data().empty()) {
            root.children.emplace_back(ConfigNode{key, node.data(), {}, NodeType::VALUE});
            continue;
        }

        ConfigNode sectionNode{key, "", {}, NodeType::SECTION};
        for (const auto &[name, value]: node)
            sectionNode.children.emplace_back(ConfigNode{name, value.data(), {}, NodeType::VALUE});

        root.children.push_back(std::move(sectionNode));
    }

    return root;
}
} // namespace


ConfigNode parseIniFile(const std::filesystem::path &filename)
{
    boost::property_tree::ptree pt;
    try {
        boost::property_tree::read_ini(filename.string(), pt);
    } catch (const boost::property_tree::ptree_error &e) {
        // convert boost::property_tree exceptions to cfg_exception
        throw cfg_exception(fmt::format("Failed to parse INI file '{}': {}", filename.string(), e.what()));
    }

    return toConfigNode(pt);
}


ConfigNode parseIniStream(std::istream &stream)
{
    boost::property_tree::ptree pt;
    try {
        boost::property_tree::read_ini(stream, pt);
    } catch (const boost::property_tree::ptree_error &e) {
        throw cfg_exception(fmt::format("Failed to parse INI input: {}", e.what()));
    }

    return toConfigNode(pt);
}

} // namespace xorgconf::cfg
