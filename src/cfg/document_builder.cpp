#include "document_builder.hpp"
#include "xorg/sections.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace xorgconf::cfg {

namespace {
template<typename T> T &as(section &target)
{
    auto *result = dynamic_cast<T *>(&target);
    if (result == nullptr)
        throw std::logic_error(fmt::format(R"(section "{}" is not of the described type)", target.tag()));
    return *result;
}


template<typename T>
const T &resolve(const document &doc, const std::string &identifier, const XorgSection &from, const char *kind)
{
    const auto *result = doc.find<T>(identifier);
    if (result == nullptr)
        throw cfg_exception(fmt::format("Section '{}' references unknown {} '{}'", from.sectionName, kind, identifier));
    return *result;
}


template<typename T> void applyInputFields(T &s, const InputFields &f)
{
    s.set_auto_server_layout(f.auto_server_layout)
        .set_floating(f.floating)
        .set_transformation_matrix(f.transformation_matrix)
        .set_acceleration_profile(f.acceleration_profile)
        .set_constant_deceleration(f.constant_deceleration)
        .set_adaptive_deceleration(f.adaptive_deceleration)
        .set_acceleration_scheme(f.acceleration_scheme)
        .set_acceleration_numerator(f.acceleration_numerator)
        .set_acceleration_denominator(f.acceleration_denominator)
        .set_acceleration_threshold(f.acceleration_threshold);
}
} // namespace


std::unique_ptr<section> DeviceSection::create() const
{
    auto s = std::make_unique<device_section>(identifier, driver);
    s->set_bus_id(bus_id).set_screen(screen);
    return s;
}


std::unique_ptr<section> MonitorSection::create() const
{
    auto s = std::make_unique<monitor_section>(identifier);
    s->set_mode_lines(mode_lines)
        .set_primary(primary)
        .set_preferred_mode(preferred_mode)
        .set_position(position_x, position_y)
        .set_left_of(left_of)
        .set_right_of(right_of)
        .set_above(above)
        .set_below(below)
        .set_enable(enable)
        .set_ignore(ignore)
        .set_rotate(rotate);
    return s;
}


std::unique_ptr<section> ScreenSection::create() const
{
    auto s = std::make_unique<screen_section>(identifier);
    s->set_default_depth(default_depth).set_accel(accel);
    return s;
}


void ScreenSection::link(section &target, const document &doc) const
{
    auto &screen = as<screen_section>(target);
    screen.set_device(resolve<device_section>(doc, device, *this, "Device"));
    screen.set_monitor(resolve<monitor_section>(doc, monitor, *this, "Monitor"));
}


std::unique_ptr<section> ServerLayoutSection::create() const
{
    return std::make_unique<server_layout_section>(identifier);
}


void ServerLayoutSection::link(section &target, const document &doc) const
{
    auto &layout = as<server_layout_section>(target);
    for (const auto &id: screens)
        layout.add_screen(resolve<screen_section>(doc, id, *this, "Screen"));
    for (const auto &id: input_devices)
        layout.add_input_device(resolve<input_device_section>(doc, id, *this, "InputDevice"));
}


std::unique_ptr<section> InputDeviceSection::create() const
{
    auto s = std::make_unique<input_device_section>(identifier, driver);
    applyInputFields(*s, *this);
    return s;
}


std::unique_ptr<section> InputClassSection::create() const
{
    auto s = std::make_unique<input_class_section>(identifier, driver);
    applyInputFields(*s, *this);
    s->set_match_product(match_product)
        .set_match_vendor(match_vendor)
        .set_match_device_path(match_device_path)
        .set_match_os(match_os)
        .set_match_pnp_id(match_pnp_id)
        .set_match_usb_id(match_usb_id)
        .set_match_driver(match_driver)
        .set_match_tag(match_tag)
        .set_match_layout(match_layout)
        .set_match_is_keyboard(match_is_keyboard)
        .set_match_is_pointer(match_is_pointer)
        .set_match_is_joystick(match_is_joystick)
        .set_match_is_tablet(match_is_tablet)
        .set_match_is_touchpad(match_is_touchpad)
        .set_match_is_touchscreen(match_is_touchscreen)
        .set_ignore(ignore);
    return s;
}


std::unique_ptr<section> FilesSection::create() const
{
    auto s = std::make_unique<files_section>();
    s->set_font_paths(font_path).set_module_paths(module_path).set_xkb_dir(xkb_dir);
    return s;
}


std::unique_ptr<section> ModuleSection::create() const
{
    auto s = std::make_unique<module_section>();
    s->set_load(load).set_disable(disable);
    return s;
}


std::unique_ptr<section> DriSection::create() const
{
    auto s = std::make_unique<dri_section>();
    s->set_mode(mode);
    return s;
}


std::unique_ptr<section> ServerFlagsSection::create() const
{
    auto s = std::make_unique<server_flags_section>();
    s->set_default_server_layout(default_server_layout)
        .set_no_trap_signals(no_trap_signals)
        .set_use_sigio(use_sigio)
        .set_dont_vt_switch(dont_vt_switch)
        .set_dont_zap(dont_zap)
        .set_dont_zoom(dont_zoom)
        .set_disable_vid_mode_extension(disable_vid_mode_extension)
        .set_allow_non_local_xvidtune(allow_non_local_xvidtune)
        .set_allow_mouse_open_fail(allow_mouse_open_fail)
        .set_blank_time(blank_time)
        .set_standby_time(standby_time)
        .set_suspend_time(suspend_time)
        .set_off_time(off_time)
        .set_pixmap(pixmap)
        .set_no_pm(no_pm)
        .set_xinerama(xinerama)
        .set_aiglx(aiglx)
        .set_dri2(dri2)
        .set_glx_visuals(glx_visuals)
        .set_use_default_font_path(use_default_font_path)
        .set_ignore_abi(ignore_abi)
        .set_auto_add_devices(auto_add_devices)
        .set_auto_enable_devices(auto_enable_devices)
        .set_log(log)
        .set_dpms(dpms);
    return s;
}


value parseOptionValue(const std::string &raw)
{
    if (raw.empty())
        return value{std::string{}};

    if (boost::iequals(raw, "true"))
        return value{true};
    if (boost::iequals(raw, "false"))
        return value{false};

    // only canonical decimals: "0666" and "+5" would lose their spelling
    if (long long number; boost::conversion::try_lexical_convert(raw, number) && fmt::format("{}", number) == raw)
        return value{number};

    return value{raw};
}


document buildDocument(const Config &config)
{
    document doc;
    std::vector<std::pair<const XorgSection *, section *>> created;
    created.reserve(config.sections.size());

    for (const auto &desc: config.sections) {
        auto s = desc->create();
        for (const auto &[name, raw]: desc->options)
            s->add_option(name, parseOptionValue(raw));
        s->set_custom_lines(desc->custom_lines);

        spdlog::debug("Section '[{}]' becomes a {} section with {} user options", desc->sectionName, s->tag(),
                      desc->options.size());
        created.emplace_back(desc.get(), &doc.add_section(std::move(s)));
    }

    // second pass: every referenced section exists now
    for (const auto &[desc, s]: created)
        desc->link(*s, doc);

    return doc;
}

} // namespace xorgconf::cfg
