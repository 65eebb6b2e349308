#pragma once

#include "cfg_exception.hpp"
#include "config_node.hpp"
#include "deserializer.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace xorgconf::cfg {

// --------------------------------------------------------------------------------
// Section support - unified base for both static and dynamic sections

// Base class for all sections
struct BaseSection {
    std::string sectionName;
    virtual ~BaseSection() = default;
};

// Base class for all dynamic sections; the INI key "section" selects the type
struct BaseDynamicSection : BaseSection {
    // key holding the type of a dynamic section
    static constexpr char TYPE_KEY[] = "section";
    // prefix of keys collected into options, e.g. "option.AccelMethod"
    static constexpr char OPTION_PREFIX[] = "option.";
    // prefix of keys holding one raw line each, e.g. "custom_line.1"
    static constexpr char CUSTOM_LINE_PREFIX[] = "custom_line.";

    std::string type;
    // (name, raw value) in file order
    std::vector<std::pair<std::string, std::string>> options;
    // raw lines in file order; the key suffix only labels them
    std::vector<std::string> custom_lines;

    // Collect "option.<Name>" and "custom_line.<label>" keys from the section node
    void collectOptions(const ConfigNode &node)
    {
        options = node.childrenWithPrefix(OPTION_PREFIX);
        for (const auto &[name, value]: options)
            if (name.empty())
                throw cfg_exception(fmt::format("Section '{}' has an option without a name", node.key));

        custom_lines.clear();
        for (const auto &[label, line]: node.childrenWithPrefix(CUSTOM_LINE_PREFIX)) {
            if (label.empty())
                throw cfg_exception(fmt::format("Section '{}' has a custom line without a label", node.key));
            custom_lines.push_back(line);
        }
    }
};

// Factory function type for creating static sections
using StaticSectionFactory = std::function<std::unique_ptr<BaseSection>(const ConfigNode &)>;

// Factory function type for creating dynamic sections
using DynamicSectionFactory = std::function<std::unique_ptr<BaseDynamicSection>(const ConfigNode &)>;

// Registry for static sections
class StaticSectionRegistry {
public:
    static void registerFactory(const std::string &sectionName, const StaticSectionFactory &factory,
                                bool mandatory = false);
    static std::unique_ptr<BaseSection> create(const std::string &sectionName, const ConfigNode &node);
    static bool hasSection(const std::string &sectionName);
    static bool isMandatory(const std::string &sectionName);
    static std::vector<std::string> getMandatorySections();
};

// Registry for dynamic sections only
class DynamicSectionRegistry {
public:
    static void registerFactory(const std::string &type, const DynamicSectionFactory &factory);
    static std::unique_ptr<BaseDynamicSection> create(const std::string &type, const ConfigNode &node);
    // case-insensitive
    static bool hasType(const std::string &type);
    // registered type names, sorted
    static std::vector<std::string> types();
};

// Shared implementation for static section registration; header-safe via inline variable
#define REGISTER_STATIC_SECTION_INLINE_IMPL(Type, SectionName, Mandatory, ...)                                         \
    static_assert(std::is_base_of_v<BaseSection, Type>, #Type " must inherit from BaseSection");                       \
    REGISTER_STRUCT(Type, __VA_ARGS__)                                                                                 \
    inline const bool Type##_static_registered = []() {                                                                \
        StaticSectionRegistry::registerFactory(                                                                        \
            SectionName,                                                                                               \
            [](const ConfigNode &node) -> std::unique_ptr<BaseSection> {                                               \
                auto obj = std::make_unique<Type>(deserialize<Type>(node));                                            \
                obj->sectionName = node.key;                                                                           \
                return obj;                                                                                            \
            },                                                                                                         \
            (Mandatory));                                                                                              \
        return true;                                                                                                   \
    }();

#define REGISTER_STATIC_SECTION_INLINE(Type, SectionName, ...)                                                         \
    REGISTER_STATIC_SECTION_INLINE_IMPL(Type, SectionName, false, __VA_ARGS__)

#define REGISTER_STATIC_SECTION_MANDATORY(Type, SectionName, ...)                                                      \
    REGISTER_STATIC_SECTION_INLINE_IMPL(Type, SectionName, true, __VA_ARGS__)

// Header-safe variant that ensures single registration across TUs using inline variable
#define REGISTER_DYNAMIC_SECTION_INLINE(Type, TypeName, ...)                                                           \
    static_assert(std::is_base_of_v<BaseDynamicSection, Type>, #Type " must inherit from BaseDynamicSection");         \
    REGISTER_STRUCT(Type, __VA_ARGS__)                                                                                 \
    inline const bool Type##_dynamic_registered = []() {                                                               \
        DynamicSectionRegistry::registerFactory(TypeName,                                                              \
                                                [](const ConfigNode &node) -> std::unique_ptr<BaseDynamicSection> {    \
                                                    auto obj = std::make_unique<Type>(deserialize<Type>(node));        \
                                                    obj->sectionName = node.key;                                       \
                                                    obj->type = TypeName;                                              \
                                                    obj->collectOptions(node);                                         \
                                                    return obj;                                                        \
                                                });                                                                    \
        return true;                                                                                                   \
    }();

} // namespace xorgconf::cfg
