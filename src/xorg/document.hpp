#pragma once
#include "section.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace xorgconf {

enum class write_status { written, nothing_to_render };


// A complete xorg.conf: the sections it owns, in output order.
class document {
public:
    using sections_type = std::vector<std::unique_ptr<section>>;

    document() = default;
    document(const document &) = delete;
    document &operator=(const document &) = delete;
    document(document &&) = default;
    document &operator=(document &&) = default;

    // No uniqueness checks: duplicate identifiers are the X server's business.
    section &add_section(std::unique_ptr<section> s);

    template<typename T, typename... Args> T &emplace_section(Args &&...args)
    {
        static_assert(std::is_base_of_v<section, T>, "T must inherit from section");
        auto s = std::make_unique<T>(std::forward<Args>(args)...);
        T &ref = *s;
        add_section(std::move(s));
        return ref;
    }

    // Replaces all sections. Sections referenced from elsewhere must remain owned somewhere.
    void set_sections(sections_type sections);
    const sections_type &sections() const { return sections_; }

    std::size_t size() const { return sections_.size(); }
    bool empty() const { return sections_.empty(); }
    void clear() { sections_.clear(); }

    // Sections matching every given filter, in registration order. Sections without an
    // identifier never match an identifier filter.
    std::vector<section *> get_sections(std::optional<section_type> type = std::nullopt,
                                        const std::optional<std::string> &identifier = std::nullopt);
    std::vector<const section *> get_sections(std::optional<section_type> type = std::nullopt,
                                              const std::optional<std::string> &identifier = std::nullopt) const;

    // First match of get_sections(), nullptr if there is none
    section *get_section(std::optional<section_type> type = std::nullopt,
                         const std::optional<std::string> &identifier = std::nullopt);
    const section *get_section(std::optional<section_type> type = std::nullopt,
                               const std::optional<std::string> &identifier = std::nullopt) const;

    // First section of the concrete type T with the given identifier, nullptr if there is none
    template<typename T> T *find(const std::string &identifier)
    {
        for (const auto &s: sections_)
            if (auto *t = dynamic_cast<T *>(s.get()); t != nullptr && t->identifier() == identifier)
                return t;
        return nullptr;
    }

    template<typename T> const T *find(const std::string &identifier) const
    {
        for (const auto &s: sections_)
            if (const auto *t = dynamic_cast<const T *>(s.get()); t != nullptr && t->identifier() == identifier)
                return t;
        return nullptr;
    }

    // Rendered sections, each followed by a blank line. std::nullopt when there are no
    // sections. Throws render_exception when any section lacks required fields.
    std::optional<std::string> render() const;

    // Renders once and writes the result to path. Nothing is written when there is nothing to
    // render. Throws write_exception (and render_exception from render()).
    write_status write(const std::filesystem::path &path) const;

private:
    static bool matches(const section &s, std::optional<section_type> type,
                        const std::optional<std::string> &identifier);

    sections_type sections_;
};

} // namespace xorgconf
