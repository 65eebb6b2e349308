#include "config.hpp"
#include "utils/string.hpp"
#include <map>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace xorgconf::cfg {

namespace {
// Identifiers of the described sections of type T
template<typename T> std::unordered_set<std::string> identifiersOf(const Config &config)
{
    std::unordered_set<std::string> result;
    for (const auto &s: config.sections)
        if (const auto *t = dynamic_cast<const T *>(s.get()))
            result.insert(t->identifier);
    return result;
}


void requireReference(const std::unordered_set<std::string> &known, const std::string &identifier,
                      const XorgSection &from, const char *kind)
{
    if (known.find(identifier) == known.end())
        throw cfg_exception(fmt::format("Section '{}' references unknown {} '{}'", from.sectionName, kind, identifier));
}


// References must resolve to a section that exists somewhere in the file
void validateReferences(const Config &config)
{
    const auto devices = identifiersOf<DeviceSection>(config);
    const auto monitors = identifiersOf<MonitorSection>(config);
    const auto screens = identifiersOf<ScreenSection>(config);
    const auto inputDevices = identifiersOf<InputDeviceSection>(config);

    for (const auto &s: config.sections) {
        if (const auto *screen = dynamic_cast<const ScreenSection *>(s.get())) {
            requireReference(devices, screen->device, *screen, "Device");
            requireReference(monitors, screen->monitor, *screen, "Monitor");
        } else if (const auto *layout = dynamic_cast<const ServerLayoutSection *>(s.get())) {
            for (const auto &id: layout->screens)
                requireReference(screens, id, *layout, "Screen");
            for (const auto &id: layout->input_devices)
                requireReference(inputDevices, id, *layout, "InputDevice");
        }
    }
}


// Same identifier twice within one section type makes references ambiguous
void warnDuplicateIdentifiers(const Config &config)
{
    std::map<std::pair<std::string, std::string>, std::string> seen;
    for (const auto &s: config.sections) {
        std::string identifier;
        if (const auto *d = dynamic_cast<const DeviceSection *>(s.get()))
            identifier = d->identifier;
        else if (const auto *m = dynamic_cast<const MonitorSection *>(s.get()))
            identifier = m->identifier;
        else if (const auto *sc = dynamic_cast<const ScreenSection *>(s.get()))
            identifier = sc->identifier;
        else if (const auto *i = dynamic_cast<const InputDeviceSection *>(s.get()))
            identifier = i->identifier;
        else
            continue;

        const auto [it, inserted] = seen.emplace(std::make_pair(s->type, identifier), s->sectionName);
        if (!inserted)
            spdlog::warn("Sections '[{}]' and '[{}]' share the {} identifier '{}'; references resolve to '[{}]'",
                         it->second, s->sectionName, s->type, identifier, it->second);
    }
}
} // namespace


void XorgSection::link(section &, const document &) const
{ }


// Implementation of custom deserializer for Config
template<> Config deserialize<Config>(const ConfigNode &node)
{
    if (!node.isRoot())
        throw std::invalid_argument("Config deserializer requires a root ConfigNode");

    Config config{};
    std::unordered_set<std::string> foundSections;

    for (const auto &child: node.children) {
        if (!child.isSection())
            throw cfg_exception("Global keys are not allowed in configuration; found key: '" + child.key + "'");

        if (StaticSectionRegistry::hasSection(child.key)) {
            // This is a static section
            foundSections.insert(child.key);
            auto section = StaticSectionRegistry::create(child.key, child);

            if (auto *generalSection = dynamic_cast<GeneralSection *>(section.get()))
                config.general = *generalSection;
        } else if (const auto sectionType = child.findValue(BaseDynamicSection::TYPE_KEY)) {
            // This is a dynamic section
            if (DynamicSectionRegistry::hasType(*sectionType)) {
                auto section = DynamicSectionRegistry::create(*sectionType, child);
                if (dynamic_cast<XorgSection *>(section.get())) {
                    // Cast succeeded, safe to transfer ownership
                    config.sections.emplace_back(static_cast<XorgSection *>(section.release()));
                } else {
                    throw cfg_exception("Dynamic section type '" + *sectionType +
                                        "' does not derive from XorgSection");
                }
            } else {
                // Log warning, but allow for forward-compatability
                spdlog::warn("Unknown configuration section ignored: section = '[{}]', {} = '{}' (expected one of: {})",
                             child.key, BaseDynamicSection::TYPE_KEY, *sectionType,
                             utils::string::join(DynamicSectionRegistry::types(), ", "));
            }
        } else {
            spdlog::warn("Configuration section '[{}]' ignored: no '{}' key", child.key, BaseDynamicSection::TYPE_KEY);
        }
    }

    // Validate that all mandatory static sections are present
    auto mandatorySections = StaticSectionRegistry::getMandatorySections();
    for (const auto &mandatorySection: mandatorySections)
        if (foundSections.find(mandatorySection) == foundSections.end())
            throw cfg_exception("Required section '[" + mandatorySection + "]' is missing from configuration");

    // Perform cross-section validation
    validateReferences(config);
    warnDuplicateIdentifiers(config);

    return config;
}

} // namespace xorgconf::cfg
