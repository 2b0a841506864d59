// ==============================================================================
// test_report_gtest.cpp - Тесты текстового отчёта (GoogleTest)
// ==============================================================================
//
// Тесты: TST-REP-001..TST-REP-011
//
// ==============================================================================

#include "codecollector/report.hpp"

#include "test_fs.hpp"

#include <gtest/gtest.h>
#include <string>

namespace codecollector::report::test {

class ReportTest : public codecollector::test::TempDirTest {
protected:
    std::filesystem::path project() const { return test_dir_ / "project"; }
    std::filesystem::path out() const { return test_dir_ / "report.txt"; }
};

// ==============================================================================
// Заголовок
// ==============================================================================

TEST_F(ReportTest, TST_REP_001_Header) {
    // Arrange
    write_file(project() / "a.py", "x = 1\n");
    write_file(project() / "b.py", "y = 2\n");
    TextFormatter formatter;

    // Act
    WriteStatus status = formatter.write({project() / "a.py", project() / "b.py"}, project(), out());

    // Assert
    ASSERT_TRUE(status.ok) << status.error;
    std::string text = read_file(out());
    EXPECT_EQ(text.rfind("# Code Collection Report\n", 0), 0u);
    EXPECT_NE(text.find("Project Path: " + project().string() + "\n"), std::string::npos);
    EXPECT_NE(text.find("File Count: 2\n"), std::string::npos);
    EXPECT_NE(text.find("Generated At: "), std::string::npos);
    EXPECT_NE(text.find("Total Size: 12.00 B\n"), std::string::npos);
}

TEST_F(ReportTest, TST_REP_002_EmptyFileList_HeaderOnly) {
    TextFormatter formatter;

    WriteStatus status = formatter.write({}, project(), out());

    ASSERT_TRUE(status.ok);
    std::string text = read_file(out());
    EXPECT_NE(text.find("File Count: 0\n"), std::string::npos);
    EXPECT_NE(text.find("Total Size: 0.00 B\n"), std::string::npos);
    EXPECT_EQ(text.find("## File:"), std::string::npos);
}

// ==============================================================================
// Макеты
// ==============================================================================

TEST_F(ReportTest, TST_REP_003_StandardLayout_Section) {
    write_file(project() / "src" / "app.py", "app = None\n");
    TextFormatter formatter(Layout::Standard);

    ASSERT_TRUE(formatter.write({project() / "src" / "app.py"}, project(), out()).ok);

    std::string text = read_file(out());
    EXPECT_NE(text.find("## File: src/app.py\n"
                        "Size: 11.00 B\n"
                        "```python\n"
                        "app = None\n"
                        "```\n"),
              std::string::npos);
}

TEST_F(ReportTest, TST_REP_004_StandardLayout_MissingTrailingNewline) {
    write_file(project() / "main.go", "package main");
    TextFormatter formatter(Layout::Standard);

    ASSERT_TRUE(formatter.write({project() / "main.go"}, project(), out()).ok);

    std::string text = read_file(out());
    EXPECT_NE(text.find("```go\npackage main\n```\n"), std::string::npos);
}

TEST_F(ReportTest, TST_REP_005_IndexedLayout_Sections) {
    write_file(project() / "a.py", "print('a')\n");
    write_file(project() / "b.md", "# B\n");
    TextFormatter formatter(Layout::Indexed);

    ASSERT_TRUE(formatter.write({project() / "a.py", project() / "b.md"}, project(), out()).ok);

    std::string text = read_file(out());
    EXPECT_NE(text.find("####### [idx:1] a.py\nprint('a')\n####### [end:1]\n"),
              std::string::npos);
    EXPECT_NE(text.find("####### [idx:2] b.md\n# B\n####### [end:2]\n"), std::string::npos);
    EXPECT_EQ(formatter.name(), "indexed");
}

TEST_F(ReportTest, TST_REP_006_BinaryContent_Skipped) {
    write_file(project() / "data.json", std::string("{\0\0}", 4));
    TextFormatter formatter;

    ASSERT_TRUE(formatter.write({project() / "data.json"}, project(), out()).ok);

    EXPECT_NE(read_file(out()).find("[binary file skipped]"), std::string::npos);
}

TEST_F(ReportTest, TST_REP_007_UnreadableFile_Placeholder) {
    TextFormatter formatter;

    // Файл исчез между сканированием и записью отчёта
    WriteStatus status = formatter.write({project() / "gone.py"}, project(), out());

    ASSERT_TRUE(status.ok);
    EXPECT_NE(read_file(out()).find("[unreadable: cannot open file]"), std::string::npos);
}

TEST_F(ReportTest, TST_REP_008_OutputCannotBeOpened) {
    write_file(test_dir_ / "blocker", "file, not a directory");
    TextFormatter formatter;

    WriteStatus status = formatter.write({}, project(), test_dir_ / "blocker" / "report.txt");

    EXPECT_FALSE(status.ok);
    EXPECT_NE(status.error.find("failed to open report file"), std::string::npos);
}

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

TEST(FormatBytesTest, TST_REP_009_Units) {
    EXPECT_EQ(format_bytes(0), "0.00 B");
    EXPECT_EQ(format_bytes(1023), "1023.00 B");
    EXPECT_EQ(format_bytes(1024), "1.00 KB");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(1024LL * 1024), "1.00 MB");
    EXPECT_EQ(format_bytes(1024LL * 1024 * 1024), "1.00 GB");
    EXPECT_EQ(format_bytes(1024LL * 1024 * 1024 * 1024), "1.00 TB");
    EXPECT_EQ(format_bytes(-100), "-100.00 B");
}

TEST(LanguageTagTest, TST_REP_010_KnownAndUnknownExtensions) {
    EXPECT_EQ(language_tag("a.py"), "python");
    EXPECT_EQ(language_tag("a.hpp"), "cpp");
    EXPECT_EQ(language_tag("a.yml"), "yaml");
    EXPECT_EQ(language_tag("Makefile"), "");
    EXPECT_EQ(language_tag("a.unknown"), "");
}

TEST(LayoutTest, TST_REP_011_ParseLayout) {
    EXPECT_EQ(parse_layout("standard"), Layout::Standard);
    EXPECT_EQ(parse_layout("indexed"), Layout::Indexed);
    EXPECT_FALSE(parse_layout("markdown").has_value());
    EXPECT_STREQ(layout_to_string(Layout::Indexed), "indexed");
}

}  // namespace codecollector::report::test
