#include "section_registry.hpp"
#include "utils/string.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace xorgconf::cfg {

namespace {
// Factories keyed by name. Dynamic section types are matched case-insensitively, so
// "section = inputclass" selects "InputClass".
template<typename Factory> class FactoryTable {
public:
    explicit FactoryTable(bool caseInsensitive)
        : caseInsensitive_{caseInsensitive}
    { }

    void add(const std::string &kind, const std::string &name, const Factory &factory)
    {
        if (!factories_.emplace(key(name), Entry{name, factory}).second)
            throw cfg_exception("Duplicate " + kind + " section factory registration: " + name);
    }

    const Factory *find(const std::string &name) const
    {
        const auto it = factories_.find(key(name));
        return it == factories_.end() ? nullptr : &it->second.factory;
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        for (const auto &[k, entry]: factories_)
            result.push_back(entry.name);
        return result;
    }

private:
    struct Entry {
        std::string name; // as registered
        Factory factory;
    };

    std::string key(const std::string &name) const { return caseInsensitive_ ? utils::string::to_lower(name) : name; }

    bool caseInsensitive_;
    std::map<std::string, Entry> factories_;
};

FactoryTable<StaticSectionFactory> &staticFactories()
{
    static FactoryTable<StaticSectionFactory> factories{false}; // function-local static; thread-safe initialization
    return factories;
}

FactoryTable<DynamicSectionFactory> &dynamicFactories()
{
    static FactoryTable<DynamicSectionFactory> factories{true};
    return factories;
}

std::set<std::string> &mandatorySections()
{
    static std::set<std::string> sections;
    return sections;
}
} // namespace

// StaticSectionRegistry implementation
void StaticSectionRegistry::registerFactory(const std::string &sectionName, const StaticSectionFactory &factory,
                                            bool mandatory)
{
    staticFactories().add("static", sectionName, factory);
    if (mandatory)
        mandatorySections().insert(sectionName);
}

std::unique_ptr<BaseSection> StaticSectionRegistry::create(const std::string &sectionName, const ConfigNode &node)
{
    if (const auto *factory = staticFactories().find(sectionName))
        return (*factory)(node);
    throw cfg_exception("Unknown static section: " + sectionName);
}

bool StaticSectionRegistry::hasSection(const std::string &sectionName)
{
    return staticFactories().find(sectionName) != nullptr;
}

bool StaticSectionRegistry::isMandatory(const std::string &sectionName)
{
    return mandatorySections().count(sectionName) != 0;
}

std::vector<std::string> StaticSectionRegistry::getMandatorySections()
{
    const auto &m = mandatorySections();
    return std::vector<std::string>(m.begin(), m.end());
}

// DynamicSectionRegistry implementation
void DynamicSectionRegistry::registerFactory(const std::string &type, const DynamicSectionFactory &factory)
{
    dynamicFactories().add("dynamic", type, factory);
}

std::unique_ptr<BaseDynamicSection> DynamicSectionRegistry::create(const std::string &type, const ConfigNode &node)
{
    if (const auto *factory = dynamicFactories().find(type))
        return (*factory)(node);
    throw cfg_exception("Unknown section type: " + type);
}

bool DynamicSectionRegistry::hasType(const std::string &type)
{
    return dynamicFactories().find(type) != nullptr;
}

std::vector<std::string> DynamicSectionRegistry::types()
{
    return dynamicFactories().names();
}

} // namespace xorgconf::cfg
