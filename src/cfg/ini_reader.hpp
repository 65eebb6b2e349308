#pragma once

#include "cfg_exception.hpp"
#include "config_node.hpp"
#include <filesystem>
#include <istream>

namespace xorgconf::cfg {

// Reads an INI file into a ConfigNode tree: one SECTION node per [section], one VALUE node
// per key, both in file order. Keys outside of any section become VALUE children of the root.
// Sections without keys are dropped. Lines starting with ';' or '#' are comments.
// Throws cfg_exception on unreadable or malformed input, duplicate sections and duplicate keys.
[[nodiscard]] ConfigNode parseIniFile(const std::filesystem::path &filename);
[[nodiscard]] ConfigNode parseIniStream(std::istream &stream);

} // namespace xorgconf::cfg
