#include "sections.hpp"

namespace xorgconf {

files_section::files_section()
    : section{section_type::files}
{ }


entries_type files_section::entries() const
{
    return {
        {"FontPath", font_paths_},
        {"ModulePath", module_paths_},
        {"XkbDir", xkb_dir_},
    };
}


files_section &files_section::set_font_paths(std::vector<std::string> paths)
{
    font_paths_ = std::move(paths);
    return *this;
}


files_section &files_section::add_font_path(std::string path)
{
    font_paths_.push_back(std::move(path));
    return *this;
}


files_section &files_section::set_module_paths(std::vector<std::string> paths)
{
    module_paths_ = std::move(paths);
    return *this;
}


files_section &files_section::add_module_path(std::string path)
{
    module_paths_.push_back(std::move(path));
    return *this;
}


files_section &files_section::set_xkb_dir(std::optional<std::string> dir)
{
    xkb_dir_ = std::move(dir);
    return *this;
}

} // namespace xorgconf
