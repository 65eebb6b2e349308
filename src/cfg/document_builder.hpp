#pragma once

#include "config.hpp"
#include "xorg/document.hpp"
#include "xorg/value.hpp"
#include <string>

namespace xorgconf::cfg {

// Builds the document described by config. Sections keep their file order; references between
// sections are resolved once every section exists, so they may point forward in the file.
// Throws cfg_exception when a reference names no section of the expected type.
[[nodiscard]] document buildDocument(const Config &config);

// Typed option value from its INI text: true/false become booleans, canonical decimal integers
// stay unquoted ("0666" stays a string), an empty value makes a flag-only option, anything else
// is a string.
[[nodiscard]] value parseOptionValue(const std::string &raw);

} // namespace xorgconf::cfg
