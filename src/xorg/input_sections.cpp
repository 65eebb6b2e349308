#include "sections.hpp"

namespace xorgconf {

void input_accel_fields::merge_options(option_store &options) const
{
    options.set("AutoServerLayout", auto_server_layout);
    options.set("Floating", floating);
    options.set("TransformationMatrix", transformation_matrix);
    options.set("AccelerationProfile", acceleration_profile);
    options.set("ConstantDeceleration", constant_deceleration);
    options.set("AdaptiveDeceleration", adaptive_deceleration);
    options.set("AccelerationScheme", acceleration_scheme);
    options.set("AccelerationNumerator", acceleration_numerator);
    options.set("AccelerationDenominator", acceleration_denominator);
    options.set("AccelerationThreshold", acceleration_threshold);
}


input_device_section::input_device_section(std::string identifier, std::optional<std::string> driver)
    : basic_input_section{section_type::input_device, std::move(identifier), std::move(driver)}
{ }


entries_type input_device_section::entries() const
{
    return input_entries({});
}


input_class_section::input_class_section(std::string identifier, std::optional<std::string> driver)
    : basic_input_section{section_type::input_class, std::move(identifier), std::move(driver)}
{ }


entries_type input_class_section::entries() const
{
    return input_entries({
        {"MatchProduct", match_product_},
        {"MatchVendor", match_vendor_},
        {"MatchDevicePath", match_device_path_},
        {"MatchOS", match_os_},
        {"MatchPnPID", match_pnp_id_},
        {"MatchUSBID", match_usb_id_},
        {"MatchDriver", match_driver_},
        {"MatchTag", match_tag_},
        {"MatchLayout", match_layout_},
        {"MatchIsKeyboard", match_is_keyboard_},
        {"MatchIsPointer", match_is_pointer_},
        {"MatchIsJoystick", match_is_joystick_},
        {"MatchIsTablet", match_is_tablet_},
        {"MatchIsTouchpad", match_is_touchpad_},
        {"MatchIsTouchscreen", match_is_touchscreen_},
    });
}


void input_class_section::merge_options(option_store &options) const
{
    basic_input_section::merge_options(options);
    options.set_flag("Ignore", ignore_);
}


input_class_section &input_class_section::set_match_product(std::optional<std::string> v)
{
    match_product_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_vendor(std::optional<std::string> v)
{
    match_vendor_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_device_path(std::optional<std::string> v)
{
    match_device_path_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_os(std::optional<std::string> v)
{
    match_os_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_pnp_id(std::optional<std::string> v)
{
    match_pnp_id_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_usb_id(std::optional<std::string> v)
{
    match_usb_id_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_driver(std::optional<std::string> v)
{
    match_driver_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_tag(std::optional<std::string> v)
{
    match_tag_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_layout(std::optional<std::string> v)
{
    match_layout_ = std::move(v);
    return *this;
}


input_class_section &input_class_section::set_match_is_keyboard(std::optional<bool> v)
{
    match_is_keyboard_ = v;
    return *this;
}


input_class_section &input_class_section::set_match_is_pointer(std::optional<bool> v)
{
    match_is_pointer_ = v;
    return *this;
}


input_class_section &input_class_section::set_match_is_joystick(std::optional<bool> v)
{
    match_is_joystick_ = v;
    return *this;
}


input_class_section &input_class_section::set_match_is_tablet(std::optional<bool> v)
{
    match_is_tablet_ = v;
    return *this;
}


input_class_section &input_class_section::set_match_is_touchpad(std::optional<bool> v)
{
    match_is_touchpad_ = v;
    return *this;
}


input_class_section &input_class_section::set_match_is_touchscreen(std::optional<bool> v)
{
    match_is_touchscreen_ = v;
    return *this;
}


input_class_section &input_class_section::set_ignore(std::optional<bool> v)
{
    ignore_ = v;
    return *this;
}

} // namespace xorgconf
