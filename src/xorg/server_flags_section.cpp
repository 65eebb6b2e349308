#include "sections.hpp"

namespace xorgconf {

server_flags_section::server_flags_section()
    : section{section_type::server_flags}
{ }


entries_type server_flags_section::entries() const
{
    // every server flag is an option
    return {};
}


void server_flags_section::merge_options(option_store &options) const
{
    options.set("DefaultServerLayout", default_server_layout_);
    options.set("NoTrapSignals", no_trap_signals_);
    options.set("UseSIGIO", use_sigio_);
    options.set("DontVTSwitch", dont_vt_switch_);
    options.set("DontZap", dont_zap_);
    options.set("DontZoom", dont_zoom_);
    options.set("DisableVidModeExtension", disable_vid_mode_extension_);
    options.set("AllowNonLocalXvidtune", allow_non_local_xvidtune_);
    options.set("AllowMouseOpenFail", allow_mouse_open_fail_);
    options.set("BlankTime", blank_time_);
    options.set("StandbyTime", standby_time_);
    options.set("SuspendTime", suspend_time_);
    options.set("OffTime", off_time_);
    options.set("Pixmap", pixmap_);
    options.set("NoPM", no_pm_);
    options.set("Xinerama", xinerama_);
    options.set("AIGLX", aiglx_);
    options.set("DRI2", dri2_);
    options.set("GlxVisuals", glx_visuals_);
    options.set("UseDefaultFontPath", use_default_font_path_);
    options.set("IgnoreABI", ignore_abi_);
    options.set("AutoAddDevices", auto_add_devices_);
    options.set("AutoEnableDevices", auto_enable_devices_);
    options.set("Log", log_);
    options.set("DPMS", dpms_);
}


server_flags_section &server_flags_section::set_default_server_layout(std::optional<std::string> v)
{
    default_server_layout_ = std::move(v);
    return *this;
}


server_flags_section &server_flags_section::set_no_trap_signals(std::optional<bool> v)
{
    no_trap_signals_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_use_sigio(std::optional<bool> v)
{
    use_sigio_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_dont_vt_switch(std::optional<bool> v)
{
    dont_vt_switch_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_dont_zap(std::optional<bool> v)
{
    dont_zap_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_dont_zoom(std::optional<bool> v)
{
    dont_zoom_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_disable_vid_mode_extension(std::optional<bool> v)
{
    disable_vid_mode_extension_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_allow_non_local_xvidtune(std::optional<bool> v)
{
    allow_non_local_xvidtune_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_allow_mouse_open_fail(std::optional<bool> v)
{
    allow_mouse_open_fail_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_blank_time(std::optional<int> v)
{
    blank_time_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_standby_time(std::optional<int> v)
{
    standby_time_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_suspend_time(std::optional<int> v)
{
    suspend_time_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_off_time(std::optional<int> v)
{
    off_time_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_pixmap(std::optional<int> v)
{
    pixmap_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_no_pm(std::optional<bool> v)
{
    no_pm_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_xinerama(std::optional<bool> v)
{
    xinerama_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_aiglx(std::optional<bool> v)
{
    aiglx_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_dri2(std::optional<bool> v)
{
    dri2_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_glx_visuals(std::optional<std::string> v)
{
    glx_visuals_ = std::move(v);
    return *this;
}


server_flags_section &server_flags_section::set_use_default_font_path(std::optional<bool> v)
{
    use_default_font_path_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_ignore_abi(std::optional<bool> v)
{
    ignore_abi_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_auto_add_devices(std::optional<bool> v)
{
    auto_add_devices_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_auto_enable_devices(std::optional<bool> v)
{
    auto_enable_devices_ = v;
    return *this;
}


server_flags_section &server_flags_section::set_log(std::optional<std::string> v)
{
    log_ = std::move(v);
    return *this;
}


server_flags_section &server_flags_section::set_dpms(std::optional<bool> v)
{
    dpms_ = v;
    return *this;
}

} // namespace xorgconf
