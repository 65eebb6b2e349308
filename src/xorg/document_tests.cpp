#include "document.hpp"
#include "sections.hpp"
#include "xorg_exception.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace xorgconf;

class DocumentTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / ("xorgconf_document_tests_" + std::to_string(getpid()));
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    static std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static std::size_t count(const std::string &haystack, const std::string &needle)
    {
        std::size_t n = 0;
        for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
            ++n;
        return n;
    }

    // Device, Monitor and Screen of the reference layout
    void addReferenceLayout()
    {
        auto &device = doc.emplace_section<device_section>("device1", "driverA");
        device.set_screen(4);

        auto &monitor = doc.emplace_section<monitor_section>("monitor1");
        monitor.set_primary(true).set_enable(false);

        auto &screen = doc.emplace_section<screen_section>("screen1");
        screen.set_device(device).set_monitor(monitor);
    }

    std::filesystem::path test_dir;
    document doc;
};

TEST_F(DocumentTest, EmptyDocumentRendersNothing)
{
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.render(), std::nullopt);
}

TEST_F(DocumentTest, AddSectionRejectsNull)
{
    EXPECT_THROW(doc.add_section(nullptr), std::invalid_argument);
    EXPECT_TRUE(doc.empty());
}

TEST_F(DocumentTest, AddSectionReturnsStoredSection)
{
    auto &s = doc.add_section(std::make_unique<module_section>());
    EXPECT_EQ(&s, doc.sections().front().get());
    EXPECT_EQ(doc.size(), 1);
}

TEST_F(DocumentTest, ReferenceLayoutRendersInOrder)
{
    addReferenceLayout();

    EXPECT_EQ(doc.render(), "Section \"Device\"\n"
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

TEST_F(DocumentTest, OneBlockPerSection)
{
    addReferenceLayout();
    doc.emplace_section<files_section>();
    doc.emplace_section<dri_section>();

    const auto out = doc.render();
    ASSERT_TRUE(out);
    EXPECT_EQ(count(*out, "EndSection\n"), 5);
    EXPECT_EQ(count(*out, "Section \""), 5);
}

TEST_F(DocumentTest, RenderIsDeterministic)
{
    addReferenceLayout();
    doc.emplace_section<server_flags_section>().set_dpms(true).add_option("MaxClients", 512);
    EXPECT_EQ(doc.render(), doc.render());
}

TEST_F(DocumentTest, IncompleteSectionFailsRender)
{
    addReferenceLayout();
    doc.emplace_section<screen_section>("screen2");

    try {
        (void)doc.render();
        FAIL() << "render_exception expected";
    } catch (const render_exception &e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("Screen"), std::string::npos);
        EXPECT_NE(what.find("screen2"), std::string::npos);
        EXPECT_NE(what.find("Device, Monitor"), std::string::npos);
    }
}

TEST_F(DocumentTest, GetSectionsFiltersByType)
{
    addReferenceLayout();
    auto &second = doc.emplace_section<screen_section>("screen2");
    doc.emplace_section<module_section>();

    const auto screens = doc.get_sections(section_type::screen);
    ASSERT_EQ(screens.size(), 2);
    EXPECT_EQ(screens[0]->identifier(), "screen1");
    EXPECT_EQ(screens[1], &second);

    EXPECT_EQ(doc.get_sections().size(), 5);
    EXPECT_TRUE(doc.get_sections(section_type::input_class).empty());
}

TEST_F(DocumentTest, GetSectionsFiltersByIdentifier)
{
    addReferenceLayout();
    doc.emplace_section<module_section>();
    doc.emplace_section<device_section>("monitor1");

    EXPECT_EQ(doc.get_sections(std::nullopt, std::string{"monitor1"}).size(), 2);
    EXPECT_EQ(doc.get_sections(section_type::monitor, std::string{"monitor1"}).size(), 1);
    // sections without identifier never match an identifier filter
    EXPECT_TRUE(doc.get_sections(section_type::module, std::string{""}).empty());
}

TEST_F(DocumentTest, GetSectionReturnsFirstMatchOrNull)
{
    addReferenceLayout();
    auto &duplicate = doc.emplace_section<device_section>("device1");

    const auto *first = doc.get_section(section_type::device, std::string{"device1"});
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, doc.sections().front().get());
    EXPECT_NE(first, &duplicate);

    EXPECT_EQ(doc.get_section(section_type::input_device), nullptr);

    const document &cdoc = doc;
    EXPECT_EQ(cdoc.get_section(std::nullopt, std::string{"screen1"})->type(), section_type::screen);
}

TEST_F(DocumentTest, FindByConcreteType)
{
    addReferenceLayout();

    const document &cdoc = doc;
    const auto *device = cdoc.find<device_section>("device1");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->driver(), "driverA");

    EXPECT_EQ(cdoc.find<monitor_section>("device1"), nullptr);
    EXPECT_EQ(doc.find<screen_section>("screen9"), nullptr);
}

TEST_F(DocumentTest, SetSectionsAndClear)
{
    document::sections_type sections;
    sections.push_back(std::make_unique<files_section>());
    sections.push_back(std::make_unique<module_section>());
    doc.set_sections(std::move(sections));
    EXPECT_EQ(doc.size(), 2);

    document::sections_type invalid;
    invalid.push_back(nullptr);
    EXPECT_THROW(doc.set_sections(std::move(invalid)), std::invalid_argument);
    EXPECT_EQ(doc.size(), 2);

    doc.clear();
    EXPECT_TRUE(doc.empty());
}

TEST_F(DocumentTest, WriteCreatesFile)
{
    addReferenceLayout();
    const auto path = test_dir / "xorg.conf";

    EXPECT_EQ(doc.write(path), write_status::written);
    EXPECT_EQ(readFile(path), *doc.render());
}

TEST_F(DocumentTest, WriteReplacesExistingContent)
{
    const auto path = test_dir / "xorg.conf";
    std::ofstream(path) << std::string(4096, '#');

    doc.emplace_section<dri_section>().set_mode("0666");
    EXPECT_EQ(doc.write(path), write_status::written);
    EXPECT_EQ(readFile(path), "Section \"DRI\"\n  Mode \"0666\"\nEndSection\n\n");
}

TEST_F(DocumentTest, WriteSkipsEmptyDocument)
{
    const auto path = test_dir / "xorg.conf";
    EXPECT_EQ(doc.write(path), write_status::nothing_to_render);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(DocumentTest, WriteReportsIoFailure)
{
    doc.emplace_section<module_section>();
    const auto path = test_dir / "missing" / "xorg.conf";

    try {
        doc.write(path);
        FAIL() << "write_exception expected";
    } catch (const write_exception &e) {
        EXPECT_NE(std::string{e.what()}.find(path.string()), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(DocumentTest, WriteDoesNotTouchFileWhenRenderFails)
{
    const auto path = test_dir / "xorg.conf";
    std::ofstream(path) << "previous";

    doc.emplace_section<device_section>("");
    EXPECT_THROW(doc.write(path), render_exception);
    EXPECT_EQ(readFile(path), "previous");
}

TEST_F(DocumentTest, MovedDocumentKeepsReferences)
{
    addReferenceLayout();
    const auto before = doc.render();

    document moved = std::move(doc);
    EXPECT_EQ(moved.render(), before);
}
