#include "document.hpp"
#include "utils/string.hpp"
#include "xorg_exception.hpp"
#include <cerrno>
#include <fmt/core.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace xorgconf {

section &document::add_section(std::unique_ptr<section> s)
{
    if (!s)
        throw std::invalid_argument("Cannot add a null section to the document");

    sections_.push_back(std::move(s));
    return *sections_.back();
}


void document::set_sections(sections_type sections)
{
    for (const auto &s: sections)
        if (!s)
            throw std::invalid_argument("Cannot add a null section to the document");

    sections_ = std::move(sections);
}


bool document::matches(const section &s, std::optional<section_type> type, const std::optional<std::string> &identifier)
{
    if (type && s.type() != *type)
        return false;

    if (identifier) {
        const auto id = s.identifier();
        if (!id || *id != *identifier)
            return false;
    }

    return true;
}


std::vector<section *> document::get_sections(std::optional<section_type> type,
                                              const std::optional<std::string> &identifier)
{
    std::vector<section *> result;
    for (const auto &s: sections_)
        if (matches(*s, type, identifier))
            result.push_back(s.get());
    return result;
}


std::vector<const section *> document::get_sections(std::optional<section_type> type,
                                                    const std::optional<std::string> &identifier) const
{
    std::vector<const section *> result;
    for (const auto &s: sections_)
        if (matches(*s, type, identifier))
            result.push_back(s.get());
    return result;
}


section *document::get_section(std::optional<section_type> type, const std::optional<std::string> &identifier)
{
    for (const auto &s: sections_)
        if (matches(*s, type, identifier))
            return s.get();
    return nullptr;
}


const section *document::get_section(std::optional<section_type> type,
                                     const std::optional<std::string> &identifier) const
{
    for (const auto &s: sections_)
        if (matches(*s, type, identifier))
            return s.get();
    return nullptr;
}


std::optional<std::string> document::render() const
{
    if (sections_.empty())
        return std::nullopt;

    std::string result;
    for (const auto &s: sections_) {
        auto block = s->render();
        if (!block) {
            // an incomplete section would leave a misleading file behind, so the whole document fails
            const auto id = s->identifier();
            const auto desc =
                fmt::format(R"(section "{}"{} is missing required fields: {})", s->tag(),
                            id && !id->empty() ? fmt::format(R"( ("{}"))", *id) : std::string{},
                            utils::string::join(s->missing_fields(), ", "));
            spdlog::warn("Cannot render document: {}", desc);
            throw render_exception(desc);
        }

        result += *block;
        result += "\n";
    }

    return result;
}


write_status document::write(const std::filesystem::path &path) const
{
    const auto content = render();
    if (!content) {
        spdlog::debug("Nothing to render, {} left untouched", path.string());
        return write_status::nothing_to_render;
    }

    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw write_exception(fmt::format(R"(Cannot open "{}" for writing: {})", path.string(),
                                          utils::string::io_err(errno)));

    out << *content;
    out.flush();
    if (!out)
        throw write_exception(fmt::format(R"(Failed to write "{}": {})", path.string(), utils::string::io_err(errno)));

    spdlog::info("Wrote {} sections ({} bytes) to {}", sections_.size(), content->size(), path.string());
    return write_status::written;
}

} // namespace xorgconf
