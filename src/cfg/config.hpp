#pragma once

#include "section_registry.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xorgconf {
class section;
class document;
} // namespace xorgconf

namespace xorgconf::cfg {

// Static "general" section
struct GeneralSection : BaseSection {
    std::string output = "/etc/X11/xorg.conf";
    std::string log_type = "console";
    std::string log_facility = "user";
    std::string log_priority = "info";

    void validate() const
    {
        if (output.empty())
            throw cfg_exception("Section 'general' must define output");

        if (log_type != "console" && log_type != "syslog")
            throw cfg_exception("Section 'general' must set log_type to 'console' or 'syslog'");
    }
};

// Register GeneralSection as mandatory
REGISTER_STATIC_SECTION_MANDATORY(GeneralSection, "general", field("output", &GeneralSection::output),
                                  field("log_type", &GeneralSection::log_type),
                                  field("log_facility", &GeneralSection::log_facility),
                                  field("log_priority", &GeneralSection::log_priority))

// Description of one xorg.conf section
struct XorgSection : BaseDynamicSection {
    // Builds the section from the description's own fields
    virtual std::unique_ptr<section> create() const = 0;

    // Resolves references to other sections; called once every section of the document exists
    virtual void link(section &target, const document &doc) const;

protected:
    std::string displayName() const { return sectionName.empty() ? type : sectionName; }

    void requireIdentifier(const std::string &identifier) const
    {
        if (identifier.empty())
            throw cfg_exception(fmt::format("Section '{}' ({}) must define identifier", displayName(), type));
    }
};

struct DeviceSection : XorgSection {
    std::string identifier;
    std::optional<std::string> driver;
    std::optional<std::string> bus_id;
    std::optional<int> screen;

    void validate() const { requireIdentifier(identifier); }
    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(DeviceSection, "Device", field("identifier", &DeviceSection::identifier),
                                field("driver", &DeviceSection::driver), field("bus_id", &DeviceSection::bus_id),
                                field("screen", &DeviceSection::screen))

struct MonitorSection : XorgSection {
    std::string identifier;
    std::vector<std::string> mode_lines;
    std::optional<bool> primary;
    std::optional<std::string> preferred_mode;
    std::optional<int> position_x;
    std::optional<int> position_y;
    std::optional<std::string> left_of;
    std::optional<std::string> right_of;
    std::optional<std::string> above;
    std::optional<std::string> below;
    std::optional<bool> enable;
    std::optional<bool> ignore;
    std::optional<std::string> rotate;

    void validate() const
    {
        requireIdentifier(identifier);

        if (position_x.has_value() != position_y.has_value())
            throw cfg_exception(
                fmt::format("Section '{}' must set both position_x and position_y, or neither", displayName()));

        if (rotate && *rotate != "normal" && *rotate != "left" && *rotate != "right" && *rotate != "inverted")
            throw cfg_exception(fmt::format(
                "Section '{}' must set rotate to 'normal', 'left', 'right' or 'inverted'", displayName()));
    }

    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(MonitorSection, "Monitor", field("identifier", &MonitorSection::identifier),
                                field("mode_lines", &MonitorSection::mode_lines),
                                field("primary", &MonitorSection::primary),
                                field("preferred_mode", &MonitorSection::preferred_mode),
                                field("position_x", &MonitorSection::position_x),
                                field("position_y", &MonitorSection::position_y),
                                field("left_of", &MonitorSection::left_of),
                                field("right_of", &MonitorSection::right_of), field("above", &MonitorSection::above),
                                field("below", &MonitorSection::below), field("enable", &MonitorSection::enable),
                                field("ignore", &MonitorSection::ignore), field("rotate", &MonitorSection::rotate))

struct ScreenSection : XorgSection {
    std::string identifier;
    std::string device; // Device identifier
    std::string monitor; // Monitor identifier
    std::optional<int> default_depth;
    std::optional<bool> accel;

    void validate() const
    {
        requireIdentifier(identifier);

        if (device.empty())
            throw cfg_exception(fmt::format("Section '{}' must reference a device", displayName()));

        if (monitor.empty())
            throw cfg_exception(fmt::format("Section '{}' must reference a monitor", displayName()));

        if (default_depth && *default_depth <= 0)
            throw cfg_exception(fmt::format("Section '{}' must set default_depth to a positive value", displayName()));
    }

    std::unique_ptr<section> create() const override;
    void link(section &target, const document &doc) const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(ScreenSection, "Screen", field("identifier", &ScreenSection::identifier),
                                field("device", &ScreenSection::device), field("monitor", &ScreenSection::monitor),
                                field("default_depth", &ScreenSection::default_depth),
                                field("accel", &ScreenSection::accel))

struct ServerLayoutSection : XorgSection {
    std::string identifier;
    std::vector<std::string> screens; // Screen identifiers
    std::vector<std::string> input_devices; // InputDevice identifiers

    void validate() const
    {
        requireIdentifier(identifier);

        if (screens.empty())
            throw cfg_exception(fmt::format("Section '{}' must reference at least one screen", displayName()));
    }

    std::unique_ptr<section> create() const override;
    void link(section &target, const document &doc) const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(ServerLayoutSection, "ServerLayout",
                                field("identifier", &ServerLayoutSection::identifier),
                                field("screens", &ServerLayoutSection::screens),
                                field("input_devices", &ServerLayoutSection::input_devices))

// Fields shared by the InputDevice and InputClass descriptions
struct InputFields {
    std::string identifier;
    std::optional<std::string> driver;
    std::optional<bool> auto_server_layout;
    std::optional<bool> floating;
    std::optional<std::string> transformation_matrix;
    std::optional<int> acceleration_profile;
    std::optional<double> constant_deceleration;
    std::optional<double> adaptive_deceleration;
    std::optional<std::string> acceleration_scheme;
    std::optional<int> acceleration_numerator;
    std::optional<int> acceleration_denominator;
    std::optional<int> acceleration_threshold;
};

#define INPUT_FIELDS(Type)                                                                                             \
    field("identifier", &Type::identifier), field("driver", &Type::driver),                                            \
        field("auto_server_layout", &Type::auto_server_layout), field("floating", &Type::floating),                    \
        field("transformation_matrix", &Type::transformation_matrix),                                                  \
        field("acceleration_profile", &Type::acceleration_profile),                                                    \
        field("constant_deceleration", &Type::constant_deceleration),                                                  \
        field("adaptive_deceleration", &Type::adaptive_deceleration),                                                  \
        field("acceleration_scheme", &Type::acceleration_scheme),                                                      \
        field("acceleration_numerator", &Type::acceleration_numerator),                                                \
        field("acceleration_denominator", &Type::acceleration_denominator),                                            \
        field("acceleration_threshold", &Type::acceleration_threshold)

struct InputDeviceSection : XorgSection, InputFields {
    void validate() const { requireIdentifier(identifier); }
    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(InputDeviceSection, "InputDevice", INPUT_FIELDS(InputDeviceSection))

struct InputClassSection : XorgSection, InputFields {
    std::optional<std::string> match_product;
    std::optional<std::string> match_vendor;
    std::optional<std::string> match_device_path;
    std::optional<std::string> match_os;
    std::optional<std::string> match_pnp_id;
    std::optional<std::string> match_usb_id;
    std::optional<std::string> match_driver;
    std::optional<std::string> match_tag;
    std::optional<std::string> match_layout;
    std::optional<bool> match_is_keyboard;
    std::optional<bool> match_is_pointer;
    std::optional<bool> match_is_joystick;
    std::optional<bool> match_is_tablet;
    std::optional<bool> match_is_touchpad;
    std::optional<bool> match_is_touchscreen;
    std::optional<bool> ignore;

    void validate() const { requireIdentifier(identifier); }
    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(InputClassSection, "InputClass", INPUT_FIELDS(InputClassSection),
                                field("match_product", &InputClassSection::match_product),
                                field("match_vendor", &InputClassSection::match_vendor),
                                field("match_device_path", &InputClassSection::match_device_path),
                                field("match_os", &InputClassSection::match_os),
                                field("match_pnp_id", &InputClassSection::match_pnp_id),
                                field("match_usb_id", &InputClassSection::match_usb_id),
                                field("match_driver", &InputClassSection::match_driver),
                                field("match_tag", &InputClassSection::match_tag),
                                field("match_layout", &InputClassSection::match_layout),
                                field("match_is_keyboard", &InputClassSection::match_is_keyboard),
                                field("match_is_pointer", &InputClassSection::match_is_pointer),
                                field("match_is_joystick", &InputClassSection::match_is_joystick),
                                field("match_is_tablet", &InputClassSection::match_is_tablet),
                                field("match_is_touchpad", &InputClassSection::match_is_touchpad),
                                field("match_is_touchscreen", &InputClassSection::match_is_touchscreen),
                                field("ignore", &InputClassSection::ignore))

struct FilesSection : XorgSection {
    std::vector<std::string> font_path;
    std::vector<std::string> module_path;
    std::optional<std::string> xkb_dir;

    void validate() const { }
    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(FilesSection, "Files", field("font_path", &FilesSection::font_path),
                                field("module_path", &FilesSection::module_path),
                                field("xkb_dir", &FilesSection::xkb_dir))

struct ModuleSection : XorgSection {
    std::vector<std::string> load;
    std::vector<std::string> disable;

    void validate() const
    {
        for (const auto &module: load)
            if (std::find(disable.begin(), disable.end(), module) != disable.end())
                throw cfg_exception(
                    fmt::format("Section '{}' both loads and disables module '{}'", displayName(), module));
    }

    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(ModuleSection, "Module", field("load", &ModuleSection::load),
                                field("disable", &ModuleSection::disable))

struct DriSection : XorgSection {
    std::optional<std::string> mode;

    void validate() const
    {
        if (mode && mode->find_first_not_of("01234567") != std::string::npos)
            throw cfg_exception(fmt::format("Section '{}' must set mode to an octal permission mask", displayName()));
    }

    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(DriSection, "DRI", field("mode", &DriSection::mode))

struct ServerFlagsSection : XorgSection {
    std::optional<std::string> default_server_layout;
    std::optional<bool> no_trap_signals;
    std::optional<bool> use_sigio;
    std::optional<bool> dont_vt_switch;
    std::optional<bool> dont_zap;
    std::optional<bool> dont_zoom;
    std::optional<bool> disable_vid_mode_extension;
    std::optional<bool> allow_non_local_xvidtune;
    std::optional<bool> allow_mouse_open_fail;
    std::optional<int> blank_time;
    std::optional<int> standby_time;
    std::optional<int> suspend_time;
    std::optional<int> off_time;
    std::optional<int> pixmap;
    std::optional<bool> no_pm;
    std::optional<bool> xinerama;
    std::optional<bool> aiglx;
    std::optional<bool> dri2;
    std::optional<std::string> glx_visuals;
    std::optional<bool> use_default_font_path;
    std::optional<bool> ignore_abi;
    std::optional<bool> auto_add_devices;
    std::optional<bool> auto_enable_devices;
    std::optional<std::string> log;
    std::optional<bool> dpms;

    void validate() const
    {
        for (const auto &[name, minutes]: {std::pair{"blank_time", blank_time}, std::pair{"standby_time", standby_time},
                                           std::pair{"suspend_time", suspend_time}, std::pair{"off_time", off_time}})
            if (minutes && *minutes < 0)
                throw cfg_exception(fmt::format("Section '{}' must set {} >= 0", displayName(), name));

        if (pixmap && *pixmap != 24 && *pixmap != 32)
            throw cfg_exception(fmt::format("Section '{}' must set pixmap to 24 or 32", displayName()));
    }

    std::unique_ptr<section> create() const override;
};

REGISTER_DYNAMIC_SECTION_INLINE(ServerFlagsSection, "ServerFlags",
                                field("default_server_layout", &ServerFlagsSection::default_server_layout),
                                field("no_trap_signals", &ServerFlagsSection::no_trap_signals),
                                field("use_sigio", &ServerFlagsSection::use_sigio),
                                field("dont_vt_switch", &ServerFlagsSection::dont_vt_switch),
                                field("dont_zap", &ServerFlagsSection::dont_zap),
                                field("dont_zoom", &ServerFlagsSection::dont_zoom),
                                field("disable_vid_mode_extension", &ServerFlagsSection::disable_vid_mode_extension),
                                field("allow_non_local_xvidtune", &ServerFlagsSection::allow_non_local_xvidtune),
                                field("allow_mouse_open_fail", &ServerFlagsSection::allow_mouse_open_fail),
                                field("blank_time", &ServerFlagsSection::blank_time),
                                field("standby_time", &ServerFlagsSection::standby_time),
                                field("suspend_time", &ServerFlagsSection::suspend_time),
                                field("off_time", &ServerFlagsSection::off_time),
                                field("pixmap", &ServerFlagsSection::pixmap), field("no_pm", &ServerFlagsSection::no_pm),
                                field("xinerama", &ServerFlagsSection::xinerama),
                                field("aiglx", &ServerFlagsSection::aiglx), field("dri2", &ServerFlagsSection::dri2),
                                field("glx_visuals", &ServerFlagsSection::glx_visuals),
                                field("use_default_font_path", &ServerFlagsSection::use_default_font_path),
                                field("ignore_abi", &ServerFlagsSection::ignore_abi),
                                field("auto_add_devices", &ServerFlagsSection::auto_add_devices),
                                field("auto_enable_devices", &ServerFlagsSection::auto_enable_devices),
                                field("log", &ServerFlagsSection::log), field("dpms", &ServerFlagsSection::dpms))

// Main configuration
struct Config {
    GeneralSection general;
    // in file order, which is the output order
    std::vector<std::unique_ptr<XorgSection>> sections;
};

// Custom deserializer for Config to handle mixed static/dynamic sections
template<> struct is_deserializable_struct<Config> : std::true_type { };

template<> Config deserialize<Config>(const ConfigNode &node);

} // namespace xorgconf::cfg
