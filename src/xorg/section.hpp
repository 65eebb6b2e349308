#pragma once
#include "option_store.hpp"
#include "value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xorgconf {

// The section kinds understood by the X server configuration parser.
enum class section_type {
    device,
    monitor,
    screen,
    server_layout,
    input_device,
    input_class,
    files,
    module,
    dri,
    server_flags
};

// Tag as written after the Section keyword, e.g. "ServerLayout".
[[nodiscard]] std::string_view to_string(section_type type);

// Case-insensitive inverse of to_string(). Throws std::invalid_argument for unknown tags.
[[nodiscard]] section_type section_type_from_string(const std::string &tag);

using entry_type = std::pair<std::string, value>;
// std::vector, because order is important
using entries_type = std::vector<entry_type>;


// Base class for all sections.
//
// A section renders as
//
//   Section "<tag>"
//     <entries supplied by the variant>
//     <options>
//     <custom lines>
//   EndSection
//
// Fields of a variant that map to options are merged into a copy of the option store
// during render(), after the options added by the caller, so rendering never mutates
// the section.
class section {
public:
    explicit section(section_type type);
    virtual ~section() = default;

    section_type type() const { return type_; }
    std::string_view tag() const { return to_string(type_); }

    // Name other sections use to refer to this one; nothing for sections without identifier.
    virtual std::optional<std::string> identifier() const;

    // Stores the option unless the value is unset; a second call for the same name overwrites.
    section &add_option(const std::string &name, value v);
    section &add_bool_option(const std::string &name, std::optional<bool> flag);
    const value &option(const std::string &name) const;
    const option_store &options() const { return options_; }
    section &set_options(option_store options);

    section &add_custom_line(std::string line);
    const std::vector<std::string> &custom_lines() const { return custom_lines_; }
    section &set_custom_lines(std::vector<std::string> lines);

    // Names of required fields that are not set. Empty when the section is renderable.
    virtual std::vector<std::string> missing_fields() const;

    // Returns std::nullopt when required fields are missing.
    std::optional<std::string> render() const;

protected:
    // (name, value) pairs in output order; empty values are skipped.
    virtual entries_type entries() const = 0;

    // Adds the options derived from the variant's fields.
    virtual void merge_options(option_store &options) const;

    static std::string render_entry(const std::string &name, const value &v);
    static std::string render_option(const std::string &name, const value &v);

private:
    section_type type_;
    option_store options_;
    std::vector<std::string> custom_lines_;
};

} // namespace xorgconf
