#include "section.hpp"
#include "sections.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace xorgconf;

namespace {
// Minimal section exercising the shared rendering skeleton
class fake_section : public section {
public:
    fake_section()
        : section{section_type::device}
    { }

    entries_type entries_;
    std::vector<std::string> missing_;

    std::vector<std::string> missing_fields() const override { return missing_; }

protected:
    entries_type entries() const override { return entries_; }
};
} // namespace


class SectionTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }

    fake_section s;
};

TEST_F(SectionTest, TagsRoundTrip)
{
    EXPECT_EQ(to_string(section_type::server_layout), "ServerLayout");
    EXPECT_EQ(to_string(section_type::dri), "DRI");
    EXPECT_EQ(to_string(section_type::input_class), "InputClass");
    EXPECT_EQ(section_type_from_string("ServerFlags"), section_type::server_flags);
    EXPECT_EQ(section_type_from_string("inputdevice"), section_type::input_device);
    EXPECT_EQ(section_type_from_string("dri"), section_type::dri);
    EXPECT_THROW(section_type_from_string("Screens"), std::invalid_argument);
}

TEST_F(SectionTest, RendersEmptySkeleton)
{
    EXPECT_EQ(s.render(), "Section \"Device\"\nEndSection\n");
}

TEST_F(SectionTest, SkipsEmptyEntries)
{
    s.entries_ = {{"Identifier", "card0"}, {"Driver", std::optional<std::string>{}}, {"BusID", ""},
                  {"ModeLine", value::list_type{}}};
    EXPECT_EQ(s.render(), "Section \"Device\"\n  Identifier \"card0\"\nEndSection\n");
}

TEST_F(SectionTest, RendersEntryKinds)
{
    s.entries_ = {{"Identifier", "card0"},
                  {"Screen", 0},
                  {"MatchIsPointer", true},
                  {"MatchIsTablet", false},
                  {"Rate", 1.5},
                  {"FontPath", value::list_type{"/usr/share/fonts/misc", "/usr/share/fonts/TTF"}}};
    EXPECT_EQ(s.render(), "Section \"Device\"\n"
                          "  Identifier \"card0\"\n"
                          "  Screen \"0\"\n"
                          "  MatchIsPointer \"true\"\n"
                          "  MatchIsTablet \"false\"\n"
                          "  Rate \"1.5\"\n"
                          "  FontPath \"/usr/share/fonts/misc\"\n"
                          "  FontPath \"/usr/share/fonts/TTF\"\n"
                          "EndSection\n");
}

TEST_F(SectionTest, RendersOptionKinds)
{
    s.add_option("AccelMethod", "glamor")
        .add_option("TearFree", true)
        .add_option("SWcursor", false)
        .add_option("BlankTime", 10)
        .add_option("Deceleration", 2.5)
        .add_option("Ignore", "")
        .add_option("XkbLayout", value::list_type{"us", "de"});

    EXPECT_EQ(s.render(), "Section \"Device\"\n"
                          "  Option \"AccelMethod\" \"glamor\"\n"
                          "  Option \"TearFree\" \"true\"\n"
                          "  Option \"SWcursor\" \"false\"\n"
                          "  Option \"BlankTime\" 10\n"
                          "  Option \"Deceleration\" \"2.5\"\n"
                          "  Option \"Ignore\"\n"
                          "  Option \"XkbLayout\" \"us\"\n"
                          "  Option \"XkbLayout\" \"de\"\n"
                          "EndSection\n");
}

TEST_F(SectionTest, AddOptionWithUnsetValueIsNoOp)
{
    s.add_option("AccelMethod", std::optional<std::string>{});
    s.add_option("AccelMethod", value{});
    EXPECT_TRUE(s.options().empty());
}

TEST_F(SectionTest, AddOptionTwiceOverwrites)
{
    s.add_option("AccelMethod", "glamor");
    s.add_option("AccelMethod", "sna");
    EXPECT_EQ(s.options().size(), 1);
    EXPECT_EQ(s.option("AccelMethod"), value{"sna"});
}

TEST_F(SectionTest, AddBoolOption)
{
    s.add_bool_option("Accel", true).add_bool_option("Ignore", false).add_bool_option("Floating", std::nullopt);
    EXPECT_EQ(s.render(), "Section \"Device\"\n"
                          "  Option \"Accel\"\n"
                          "  Option \"Ignore\" \"false\"\n"
                          "EndSection\n");
}

TEST_F(SectionTest, CustomLinesComeLast)
{
    s.entries_ = {{"Identifier", "card0"}};
    s.add_custom_line("SubSection \"Display\"").add_custom_line("EndSubSection");
    s.add_option("TearFree", true);

    EXPECT_EQ(s.render(), "Section \"Device\"\n"
                          "  Identifier \"card0\"\n"
                          "  Option \"TearFree\" \"true\"\n"
                          "  SubSection \"Display\"\n"
                          "  EndSubSection\n"
                          "EndSection\n");

    s.set_custom_lines({});
    EXPECT_TRUE(s.custom_lines().empty());
}

TEST_F(SectionTest, NotRenderableWhenFieldsMissing)
{
    s.missing_ = {"Identifier"};
    EXPECT_EQ(s.render(), std::nullopt);
}

TEST_F(SectionTest, SetOptionsReplacesStore)
{
    s.add_option("AccelMethod", "glamor");

    option_store options;
    options.set("TearFree", true);
    s.set_options(options);

    EXPECT_FALSE(s.options().contains("AccelMethod"));
    EXPECT_TRUE(s.options().contains("TearFree"));
}

TEST_F(SectionTest, RenderIsIdempotent)
{
    monitor_section monitor{"monitor1"};
    monitor.set_primary(true).add_option("DPMS", true);

    const auto first = monitor.render();
    EXPECT_EQ(monitor.render(), first);
    // field-derived options are not written back to the store
    EXPECT_FALSE(monitor.options().contains("Primary"));
}

TEST_F(SectionTest, FieldWinsOverUserOptionOfSameName)
{
    monitor_section monitor{"monitor1"};
    monitor.add_option("Rotate", "left").add_option("DPMS", true);
    monitor.set_rotate("inverted");

    EXPECT_EQ(monitor.render(), "Section \"Monitor\"\n"
                                "  Identifier \"monitor1\"\n"
                                "  Option \"Rotate\" \"inverted\"\n"
                                "  Option \"DPMS\" \"true\"\n"
                                "EndSection\n");
}

TEST_F(SectionTest, UnsetFieldLeavesUserOptionAlone)
{
    monitor_section monitor{"monitor1"};
    monitor.add_option("Rotate", "left");

    EXPECT_EQ(monitor.render(), "Section \"Monitor\"\n"
                                "  Identifier \"monitor1\"\n"
                                "  Option \"Rotate\" \"left\"\n"
                                "EndSection\n");
}
