#include "core.hpp"
#include "xorg/sections.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

using namespace xorgconf;
using namespace xorgconf::cfg;

class DocumentBuilderTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }

    static Config load(const std::string &ini)
    {
        std::istringstream in(ini);
        return parse<Config>(parseIniStream(in));
    }

    static std::string render(const std::string &ini)
    {
        const auto out = buildDocument(load(ini)).render();
        return out ? *out : std::string{};
    }
};

TEST_F(DocumentBuilderTest, ParseOptionValueTypes)
{
    EXPECT_EQ(parseOptionValue("true"), value{true});
    EXPECT_EQ(parseOptionValue("FALSE"), value{false});
    EXPECT_EQ(parseOptionValue("512"), value{512});
    EXPECT_EQ(parseOptionValue("-1"), value{-1});
    EXPECT_EQ(parseOptionValue(""), value{""});
    EXPECT_EQ(parseOptionValue("glamor"), value{"glamor"});
    EXPECT_EQ(parseOptionValue("0 0"), value{"0 0"});
    EXPECT_EQ(parseOptionValue("1.5"), value{"1.5"});
    EXPECT_EQ(parseOptionValue("12px"), value{"12px"});
    EXPECT_EQ(parseOptionValue("on"), value{"on"});
    EXPECT_EQ(parseOptionValue("0"), value{0});
    EXPECT_EQ(parseOptionValue("0666"), value{"0666"});
    EXPECT_EQ(parseOptionValue("007"), value{"007"});
    EXPECT_EQ(parseOptionValue("+5"), value{"+5"});
    EXPECT_EQ(parseOptionValue("-0"), value{"-0"});
    EXPECT_EQ(parseOptionValue("99999999999999999999"), value{"99999999999999999999"});
}

TEST_F(DocumentBuilderTest, LeadingZerosSurviveInOptions)
{
    EXPECT_EQ(render(R"([general]
log_type = console

[dri]
section = DRI
option.Mode = 0666
option.Group = 0
)"),
              "Section \"DRI\"\n"
              "  Option \"Mode\" \"0666\"\n"
              "  Option \"Group\" 0\n"
              "EndSection\n"
              "\n");
}

TEST_F(DocumentBuilderTest, ReferenceLayoutEndToEnd)
{
    EXPECT_EQ(render(R"([general]
output = /tmp/xorg.conf

[device1]
section = Device
identifier = device1
driver = driverA
screen = 4

[monitor1]
section = Monitor
identifier = monitor1
primary = true
enable = false

[screen1]
section = Screen
identifier = screen1
device = device1
monitor = monitor1
)"),
              "Section \"Device\"\n"
              "  Identifier \"device1\"\n"
              "  Driver \"driverA\"\n"
              "  Screen \"4\"\n"
              "EndSection\n"
              "\n"
              "Section \"Monitor\"\n"
              "  Identifier \"monitor1\"\n"
              "  Option \"Primary\" \"true\"\n"
              "  Option \"Enable\" \"false\"\n"
              "EndSection\n"
              "\n"
              "Section \"Screen\"\n"
              "  Identifier \"screen1\"\n"
              "  Device \"device1\"\n"
              "  Monitor \"monitor1\"\n"
              "EndSection\n"
              "\n");
}

TEST_F(DocumentBuilderTest, OptionsAndCustomLines)
{
    EXPECT_EQ(render(R"([general]
log_priority = warning

[card0]
section = Device
identifier = card0
driver = amdgpu
option.TearFree = true
option.AccelMethod = glamor
option.SWcursor =
option.VariableRefresh = false
option.Depth = 30
custom_line.1 = SubSection "Display"
custom_line.2 = EndSubSection
)"),
              "Section \"Device\"\n"
              "  Identifier \"card0\"\n"
              "  Driver \"amdgpu\"\n"
              "  Option \"TearFree\" \"true\"\n"
              "  Option \"AccelMethod\" \"glamor\"\n"
              "  Option \"SWcursor\"\n"
              "  Option \"VariableRefresh\" \"false\"\n"
              "  Option \"Depth\" 30\n"
              "  SubSection \"Display\"\n"
              "  EndSubSection\n"
              "EndSection\n"
              "\n");
}

TEST_F(DocumentBuilderTest, CustomLinesKeepCommas)
{
    EXPECT_EQ(render(R"([general]
log_type = console

[keyboard]
section = InputClass
identifier = keyboard
match_is_keyboard = true
custom_line.b = Option "XkbLayout" "us,de"
custom_line.a = Option "XkbOptions" "grp:alt_shift_toggle,ctrl:nocaps"
)"),
              "Section \"InputClass\"\n"
              "  Identifier \"keyboard\"\n"
              "  MatchIsKeyboard \"true\"\n"
              "  Option \"XkbLayout\" \"us,de\"\n"
              "  Option \"XkbOptions\" \"grp:alt_shift_toggle,ctrl:nocaps\"\n"
              "EndSection\n"
              "\n");
}

TEST_F(DocumentBuilderTest, CustomLineWithoutLabelIsRejected)
{
    EXPECT_THROW(load(R"([general]
log_type = console

[card0]
section = Device
identifier = card0
custom_line. = Option "TearFree" "true"
)"),
                 cfg_exception);
}

TEST_F(DocumentBuilderTest, ForwardReferencesResolve)
{
    const auto config = load(R"([general]
log_type = console

[layout]
section = ServerLayout
identifier = main
screens = left, right
input_devices = kbd

[left]
section = Screen
identifier = left
device = card0
monitor = DP-1

[right]
section = Screen
identifier = right
device = card0
monitor = HDMI-1

[card0]
section = Device
identifier = card0

[DP-1]
section = Monitor
identifier = DP-1

[HDMI-1]
section = Monitor
identifier = HDMI-1
right_of = DP-1

[kbd]
section = InputDevice
identifier = kbd
driver = libinput
)");

    const document doc = buildDocument(config);
    ASSERT_EQ(doc.size(), 7);

    const auto *layout = doc.find<server_layout_section>("main");
    ASSERT_NE(layout, nullptr);
    ASSERT_EQ(layout->screens().size(), 2);
    EXPECT_EQ(layout->screens()[0], doc.find<screen_section>("left"));
    EXPECT_EQ(layout->screens()[1], doc.find<screen_section>("right"));
    ASSERT_EQ(layout->input_devices().size(), 1);
    EXPECT_EQ(layout->input_devices()[0], doc.find<input_device_section>("kbd"));

    const auto *right = doc.find<screen_section>("right");
    EXPECT_EQ(right->device(), doc.find<device_section>("card0"));
    EXPECT_EQ(right->monitor(), doc.find<monitor_section>("HDMI-1"));

    const auto out = doc.render();
    ASSERT_TRUE(out);
    EXPECT_EQ(out->find("Section \"ServerLayout\"\n"
                        "  Identifier \"main\"\n"
                        "  Screen \"left\"\n"
                        "  Screen \"right\"\n"
                        "  InputDevice \"kbd\"\n"
                        "EndSection\n"),
              0);
}

TEST_F(DocumentBuilderTest, EverySectionType)
{
    const auto out = render(R"([general]
output = /tmp/xorg.conf

[files]
section = Files
font_path = /usr/share/fonts/misc, /usr/share/fonts/TTF
xkb_dir = /usr/share/X11/xkb

[modules]
section = Module
load = glx, dri2
disable = dbe

[dri]
section = DRI
mode = 0666

[flags]
section = ServerFlags
default_server_layout = main
blank_time = 10
dont_zap = false
option.MaxClients = 512

[touchpad]
section = InputClass
identifier = touchpad
driver = libinput
match_is_touchpad = on
acceleration_profile = 1
constant_deceleration = 2.5
ignore = false
)");

    EXPECT_EQ(out, "Section \"Files\"\n"
                   "  FontPath \"/usr/share/fonts/misc\"\n"
                   "  FontPath \"/usr/share/fonts/TTF\"\n"
                   "  XkbDir \"/usr/share/X11/xkb\"\n"
                   "EndSection\n"
                   "\n"
                   "Section \"Module\"\n"
                   "  Load \"glx\"\n"
                   "  Load \"dri2\"\n"
                   "  Disable \"dbe\"\n"
                   "EndSection\n"
                   "\n"
                   "Section \"DRI\"\n"
                   "  Mode \"0666\"\n"
                   "EndSection\n"
                   "\n"
                   "Section \"ServerFlags\"\n"
                   "  Option \"MaxClients\" 512\n"
                   "  Option \"DefaultServerLayout\" \"main\"\n"
                   "  Option \"DontZap\" \"false\"\n"
                   "  Option \"BlankTime\" 10\n"
                   "EndSection\n"
                   "\n"
                   "Section \"InputClass\"\n"
                   "  Identifier \"touchpad\"\n"
                   "  Driver \"libinput\"\n"
                   "  MatchIsTouchpad \"true\"\n"
                   "  Option \"AccelerationProfile\" 1\n"
                   "  Option \"ConstantDeceleration\" \"2.5\"\n"
                   "  Option \"Ignore\" \"false\"\n"
                   "EndSection\n"
                   "\n");
}

TEST_F(DocumentBuilderTest, FieldOverridesUserOption)
{
    const auto out = render(R"([general]
output = /tmp/xorg.conf

[DP-1]
section = Monitor
identifier = DP-1
option.Rotate = left
rotate = inverted
)");

    EXPECT_NE(out.find("  Option \"Rotate\" \"inverted\"\n"), std::string::npos);
    EXPECT_EQ(out.find("\"left\""), std::string::npos);
}

TEST_F(DocumentBuilderTest, UnknownReferenceThrows)
{
    // references are checked again when building from a hand-made Config
    Config config;
    auto screen = std::make_unique<ScreenSection>();
    screen->sectionName = "screen0";
    screen->type = "Screen";
    screen->identifier = "screen0";
    screen->device = "card0";
    screen->monitor = "DP-1";
    config.sections.push_back(std::move(screen));

    EXPECT_THROW((void)buildDocument(config), cfg_exception);
}

TEST_F(DocumentBuilderTest, NoSectionsRendersNothing)
{
    const document doc = buildDocument(load("[general]\noutput = /tmp/xorg.conf\n"));
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.render(), std::nullopt);
}

TEST_F(DocumentBuilderTest, WritesConfiguredOutput)
{
    const auto dir = std::filesystem::temp_directory_path() / ("xorgconf_builder_tests_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    const auto path = dir / "xorg.conf";

    const auto config = load("[general]\noutput = " + path.string() +
                             "\n\n[modules]\nsection = Module\nload = glx\n");
    const document doc = buildDocument(config);
    EXPECT_EQ(doc.write(config.general.output), write_status::written);

    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "Section \"Module\"\n  Load \"glx\"\nEndSection\n\n");

    std::filesystem::remove_all(dir);
}
