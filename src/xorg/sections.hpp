#pragma once
#include "section.hpp"
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace xorgconf {

class device_section final : public section {
public:
    explicit device_section(std::string identifier, std::optional<std::string> driver = std::nullopt);

    std::optional<std::string> identifier() const override { return identifier_; }
    std::vector<std::string> missing_fields() const override;

    device_section &set_identifier(std::string identifier);
    device_section &set_driver(std::optional<std::string> driver);
    device_section &set_bus_id(std::optional<std::string> bus_id);
    device_section &set_screen(std::optional<int> screen);

    const std::optional<std::string> &driver() const { return driver_; }
    const std::optional<std::string> &bus_id() const { return bus_id_; }
    std::optional<int> screen() const { return screen_; }

protected:
    entries_type entries() const override;

private:
    std::string identifier_;
    std::optional<std::string> driver_;
    std::optional<std::string> bus_id_;
    // screen number on multi-head cards
    std::optional<int> screen_;
};


class monitor_section final : public section {
public:
    explicit monitor_section(std::string identifier);

    std::optional<std::string> identifier() const override { return identifier_; }
    std::vector<std::string> missing_fields() const override;

    monitor_section &set_identifier(std::string identifier);
    monitor_section &set_mode_lines(std::vector<std::string> mode_lines);
    monitor_section &add_mode_line(std::string mode_line);
    monitor_section &set_primary(std::optional<bool> primary);
    monitor_section &set_preferred_mode(std::optional<std::string> mode);
    monitor_section &set_position(std::optional<int> x, std::optional<int> y);
    monitor_section &set_left_of(std::optional<std::string> monitor);
    monitor_section &set_right_of(std::optional<std::string> monitor);
    monitor_section &set_above(std::optional<std::string> monitor);
    monitor_section &set_below(std::optional<std::string> monitor);
    monitor_section &set_enable(std::optional<bool> enable);
    monitor_section &set_ignore(std::optional<bool> ignore);
    monitor_section &set_rotate(std::optional<std::string> rotate);

    const std::vector<std::string> &mode_lines() const { return mode_lines_; }
    std::optional<bool> primary() const { return primary_; }
    std::optional<bool> enable() const { return enable_; }

protected:
    entries_type entries() const override;
    void merge_options(option_store &options) const override;

private:
    std::string identifier_;
    std::vector<std::string> mode_lines_;
    std::optional<bool> primary_;
    std::optional<std::string> preferred_mode_;
    std::optional<int> position_x_;
    std::optional<int> position_y_;
    std::optional<std::string> left_of_;
    std::optional<std::string> right_of_;
    std::optional<std::string> above_;
    std::optional<std::string> below_;
    std::optional<bool> enable_;
    std::optional<bool> ignore_;
    std::optional<std::string> rotate_;
};


class screen_section final : public section {
public:
    explicit screen_section(std::string identifier);

    std::optional<std::string> identifier() const override { return identifier_; }
    std::vector<std::string> missing_fields() const override;

    // device and monitor are observed, not owned; they must outlive this section
    screen_section &set_identifier(std::string identifier);
    screen_section &set_device(const device_section &device);
    screen_section &set_monitor(const monitor_section &monitor);
    screen_section &set_default_depth(std::optional<int> depth);
    screen_section &set_accel(std::optional<bool> accel);

    const device_section *device() const { return device_; }
    const monitor_section *monitor() const { return monitor_; }
    std::optional<int> default_depth() const { return default_depth_; }

protected:
    entries_type entries() const override;
    void merge_options(option_store &options) const override;

private:
    std::string identifier_;
    const device_section *device_ = nullptr;
    const monitor_section *monitor_ = nullptr;
    std::optional<int> default_depth_;
    std::optional<bool> accel_;
};


// Pointer acceleration and transformation options shared by InputDevice and InputClass.
struct input_accel_fields {
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

    void merge_options(option_store &options) const;
};


// Identifier, driver and acceleration fields for InputDevice and InputClass. Derived is the
// concrete section, so the setters chain on it.
template<typename Derived> class basic_input_section : public section {
public:
    std::optional<std::string> identifier() const override { return identifier_; }
    std::vector<std::string> missing_fields() const override;

    Derived &set_identifier(std::string identifier);
    Derived &set_driver(std::optional<std::string> driver);
    Derived &set_auto_server_layout(std::optional<bool> v);
    Derived &set_floating(std::optional<bool> v);
    Derived &set_transformation_matrix(std::optional<std::string> v);
    Derived &set_acceleration_profile(std::optional<int> v);
    Derived &set_constant_deceleration(std::optional<double> v);
    Derived &set_adaptive_deceleration(std::optional<double> v);
    Derived &set_acceleration_scheme(std::optional<std::string> v);
    Derived &set_acceleration_numerator(std::optional<int> v);
    Derived &set_acceleration_denominator(std::optional<int> v);
    Derived &set_acceleration_threshold(std::optional<int> v);

    const std::optional<std::string> &driver() const { return driver_; }
    const input_accel_fields &accel() const { return accel_; }

protected:
    basic_input_section(section_type type, std::string identifier, std::optional<std::string> driver);

    // Identifier and Driver, followed by extra
    entries_type input_entries(entries_type extra) const;
    void merge_options(option_store &options) const override;

private:
    Derived &self() { return static_cast<Derived &>(*this); }

    std::string identifier_;
    std::optional<std::string> driver_;
    input_accel_fields accel_;
};


class input_device_section final : public basic_input_section<input_device_section> {
public:
    explicit input_device_section(std::string identifier, std::optional<std::string> driver = std::nullopt);

protected:
    entries_type entries() const override;
};


class input_class_section final : public basic_input_section<input_class_section> {
public:
    explicit input_class_section(std::string identifier, std::optional<std::string> driver = std::nullopt);

    input_class_section &set_match_product(std::optional<std::string> v);
    input_class_section &set_match_vendor(std::optional<std::string> v);
    input_class_section &set_match_device_path(std::optional<std::string> v);
    input_class_section &set_match_os(std::optional<std::string> v);
    input_class_section &set_match_pnp_id(std::optional<std::string> v);
    input_class_section &set_match_usb_id(std::optional<std::string> v);
    input_class_section &set_match_driver(std::optional<std::string> v);
    input_class_section &set_match_tag(std::optional<std::string> v);
    input_class_section &set_match_layout(std::optional<std::string> v);
    input_class_section &set_match_is_keyboard(std::optional<bool> v);
    input_class_section &set_match_is_pointer(std::optional<bool> v);
    input_class_section &set_match_is_joystick(std::optional<bool> v);
    input_class_section &set_match_is_tablet(std::optional<bool> v);
    input_class_section &set_match_is_touchpad(std::optional<bool> v);
    input_class_section &set_match_is_touchscreen(std::optional<bool> v);
    input_class_section &set_ignore(std::optional<bool> v);

protected:
    entries_type entries() const override;
    void merge_options(option_store &options) const override;

private:
    std::optional<std::string> match_product_;
    std::optional<std::string> match_vendor_;
    std::optional<std::string> match_device_path_;
    std::optional<std::string> match_os_;
    std::optional<std::string> match_pnp_id_;
    std::optional<std::string> match_usb_id_;
    std::optional<std::string> match_driver_;
    std::optional<std::string> match_tag_;
    std::optional<std::string> match_layout_;
    std::optional<bool> match_is_keyboard_;
    std::optional<bool> match_is_pointer_;
    std::optional<bool> match_is_joystick_;
    std::optional<bool> match_is_tablet_;
    std::optional<bool> match_is_touchpad_;
    std::optional<bool> match_is_touchscreen_;
    std::optional<bool> ignore_;
};


class server_layout_section final : public section {
public:
    explicit server_layout_section(std::string identifier);

    std::optional<std::string> identifier() const override { return identifier_; }
    std::vector<std::string> missing_fields() const override;

    // screens and input devices are observed, not owned
    server_layout_section &set_identifier(std::string identifier);
    server_layout_section &add_screen(const screen_section &screen);
    server_layout_section &set_screens(std::vector<const screen_section *> screens);
    server_layout_section &add_input_device(const input_device_section &input_device);
    server_layout_section &set_input_devices(std::vector<const input_device_section *> input_devices);

    const std::vector<const screen_section *> &screens() const { return screens_; }
    const std::vector<const input_device_section *> &input_devices() const { return input_devices_; }

protected:
    entries_type entries() const override;

private:
    std::string identifier_;
    std::vector<const screen_section *> screens_;
    std::vector<const input_device_section *> input_devices_;
};


class files_section final : public section {
public:
    files_section();

    files_section &set_font_paths(std::vector<std::string> paths);
    files_section &add_font_path(std::string path);
    files_section &set_module_paths(std::vector<std::string> paths);
    files_section &add_module_path(std::string path);
    files_section &set_xkb_dir(std::optional<std::string> dir);

    const std::vector<std::string> &font_paths() const { return font_paths_; }
    const std::vector<std::string> &module_paths() const { return module_paths_; }

protected:
    entries_type entries() const override;

private:
    std::vector<std::string> font_paths_;
    std::vector<std::string> module_paths_;
    std::optional<std::string> xkb_dir_;
};


class module_section final : public section {
public:
    module_section();

    module_section &set_load(std::vector<std::string> modules);
    module_section &add_load(std::string module);
    module_section &set_disable(std::vector<std::string> modules);
    module_section &add_disable(std::string module);

    const std::vector<std::string> &load() const { return load_; }
    const std::vector<std::string> &disable() const { return disable_; }

protected:
    entries_type entries() const override;

private:
    std::vector<std::string> load_;
    std::vector<std::string> disable_;
};


class dri_section final : public section {
public:
    dri_section();

    // permission bits for the DRI device node, e.g. "0666"
    dri_section &set_mode(std::optional<std::string> mode);
    const std::optional<std::string> &mode() const { return mode_; }

protected:
    entries_type entries() const override;

private:
    std::optional<std::string> mode_;
};


class server_flags_section final : public section {
public:
    server_flags_section();

    server_flags_section &set_default_server_layout(std::optional<std::string> v);
    server_flags_section &set_no_trap_signals(std::optional<bool> v);
    server_flags_section &set_use_sigio(std::optional<bool> v);
    server_flags_section &set_dont_vt_switch(std::optional<bool> v);
    server_flags_section &set_dont_zap(std::optional<bool> v);
    server_flags_section &set_dont_zoom(std::optional<bool> v);
    server_flags_section &set_disable_vid_mode_extension(std::optional<bool> v);
    server_flags_section &set_allow_non_local_xvidtune(std::optional<bool> v);
    server_flags_section &set_allow_mouse_open_fail(std::optional<bool> v);
    // screen saver and DPMS timeouts, in minutes
    server_flags_section &set_blank_time(std::optional<int> v);
    server_flags_section &set_standby_time(std::optional<int> v);
    server_flags_section &set_suspend_time(std::optional<int> v);
    server_flags_section &set_off_time(std::optional<int> v);
    server_flags_section &set_pixmap(std::optional<int> v);
    server_flags_section &set_no_pm(std::optional<bool> v);
    server_flags_section &set_xinerama(std::optional<bool> v);
    server_flags_section &set_aiglx(std::optional<bool> v);
    server_flags_section &set_dri2(std::optional<bool> v);
    server_flags_section &set_glx_visuals(std::optional<std::string> v);
    server_flags_section &set_use_default_font_path(std::optional<bool> v);
    server_flags_section &set_ignore_abi(std::optional<bool> v);
    server_flags_section &set_auto_add_devices(std::optional<bool> v);
    server_flags_section &set_auto_enable_devices(std::optional<bool> v);
    server_flags_section &set_log(std::optional<std::string> v);
    server_flags_section &set_dpms(std::optional<bool> v);

    const std::optional<std::string> &default_server_layout() const { return default_server_layout_; }

protected:
    entries_type entries() const override;
    void merge_options(option_store &options) const override;

private:
    std::optional<std::string> default_server_layout_;
    std::optional<bool> no_trap_signals_;
    std::optional<bool> use_sigio_;
    std::optional<bool> dont_vt_switch_;
    std::optional<bool> dont_zap_;
    std::optional<bool> dont_zoom_;
    std::optional<bool> disable_vid_mode_extension_;
    std::optional<bool> allow_non_local_xvidtune_;
    std::optional<bool> allow_mouse_open_fail_;
    std::optional<int> blank_time_;
    std::optional<int> standby_time_;
    std::optional<int> suspend_time_;
    std::optional<int> off_time_;
    std::optional<int> pixmap_;
    std::optional<bool> no_pm_;
    std::optional<bool> xinerama_;
    std::optional<bool> aiglx_;
    std::optional<bool> dri2_;
    std::optional<std::string> glx_visuals_;
    std::optional<bool> use_default_font_path_;
    std::optional<bool> ignore_abi_;
    std::optional<bool> auto_add_devices_;
    std::optional<bool> auto_enable_devices_;
    std::optional<std::string> log_;
    std::optional<bool> dpms_;
};


// --------------------------------------------------------------------------------
// basic_input_section

template<typename Derived>
basic_input_section<Derived>::basic_input_section(section_type type, std::string identifier,
                                                  std::optional<std::string> driver)
    : section{type}, identifier_{std::move(identifier)}, driver_{std::move(driver)}
{ }


template<typename Derived> std::vector<std::string> basic_input_section<Derived>::missing_fields() const
{
    if (identifier_.empty())
        return {"Identifier"};
    return {};
}


template<typename Derived> entries_type basic_input_section<Derived>::input_entries(entries_type extra) const
{
    entries_type result{
        {"Identifier", identifier_},
        {"Driver", driver_},
    };
    result.insert(result.end(), std::make_move_iterator(extra.begin()), std::make_move_iterator(extra.end()));
    return result;
}


template<typename Derived> void basic_input_section<Derived>::merge_options(option_store &options) const
{
    accel_.merge_options(options);
}


template<typename Derived> Derived &basic_input_section<Derived>::set_identifier(std::string identifier)
{
    identifier_ = std::move(identifier);
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_driver(std::optional<std::string> driver)
{
    driver_ = std::move(driver);
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_auto_server_layout(std::optional<bool> v)
{
    accel_.auto_server_layout = v;
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_floating(std::optional<bool> v)
{
    accel_.floating = v;
    return self();
}


template<typename Derived>
Derived &basic_input_section<Derived>::set_transformation_matrix(std::optional<std::string> v)
{
    accel_.transformation_matrix = std::move(v);
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_acceleration_profile(std::optional<int> v)
{
    accel_.acceleration_profile = v;
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_constant_deceleration(std::optional<double> v)
{
    accel_.constant_deceleration = v;
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_adaptive_deceleration(std::optional<double> v)
{
    accel_.adaptive_deceleration = v;
    return self();
}


template<typename Derived>
Derived &basic_input_section<Derived>::set_acceleration_scheme(std::optional<std::string> v)
{
    accel_.acceleration_scheme = std::move(v);
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_acceleration_numerator(std::optional<int> v)
{
    accel_.acceleration_numerator = v;
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_acceleration_denominator(std::optional<int> v)
{
    accel_.acceleration_denominator = v;
    return self();
}


template<typename Derived> Derived &basic_input_section<Derived>::set_acceleration_threshold(std::optional<int> v)
{
    accel_.acceleration_threshold = v;
    return self();
}

} // namespace xorgconf
