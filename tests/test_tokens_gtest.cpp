// ==============================================================================
// test_tokens_gtest.cpp - Тесты статистики файлов и оценки токенов (GoogleTest)
// ==============================================================================
//
// Тесты: TST-TOK-001..TST-TOK-013
//
// ==============================================================================

#include "codecollector/tokens.hpp"

#include "test_fs.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace codecollector::analyse::test {

namespace {

std::vector<std::string> as_strings(const std::vector<std::string_view>& tokens) {
    return std::vector<std::string>(tokens.begin(), tokens.end());
}

}  // namespace

// ==============================================================================
// Пре-токенизация
// ==============================================================================

TEST(PretokenizeTest, TST_TOK_001_WordsKeepLeadingSpace) {
    std::vector<std::string> expected = {"hello", " world"};
    EXPECT_EQ(as_strings(pretokenize("hello world")), expected);
}

TEST(PretokenizeTest, TST_TOK_002_DigitsGroupedByThree) {
    std::vector<std::string> expected = {"123", "45"};
    EXPECT_EQ(as_strings(pretokenize("12345")), expected);
}

TEST(PretokenizeTest, TST_TOK_003_PunctuationAndSpaces) {
    std::vector<std::string> expected = {"x", " =", " ", "1", ";"};
    EXPECT_EQ(as_strings(pretokenize("x = 1;")), expected);
}

TEST(PretokenizeTest, TST_TOK_004_SpaceRunLeavesLastSpaceToWord) {
    std::vector<std::string> expected = {"a", " ", " b"};
    EXPECT_EQ(as_strings(pretokenize("a  b")), expected);
}

TEST(PretokenizeTest, TST_TOK_005_EmptyText) {
    EXPECT_TRUE(pretokenize("").empty());
    EXPECT_EQ(count_tokens("", TokenScheme::Subword), 0u);
    EXPECT_EQ(count_tokens("", TokenScheme::Bytes), 0u);
}

// ==============================================================================
// Подсчёт токенов
// ==============================================================================

TEST(CountTokensTest, TST_TOK_006_SubwordScheme) {
    EXPECT_EQ(count_tokens("hello world", TokenScheme::Subword), 2u);
    // 20 букв -> 4 куска по 6
    EXPECT_EQ(count_tokens("internationalization", TokenScheme::Subword), 4u);
    // print ( ' line ' )
    EXPECT_EQ(count_tokens("print('line')", TokenScheme::Subword), 6u);
}

TEST(CountTokensTest, TST_TOK_007_BytesScheme) {
    // "hello" -> 2, " world" -> 2
    EXPECT_EQ(count_tokens("hello world", TokenScheme::Bytes), 4u);
    EXPECT_EQ(count_tokens("12345", TokenScheme::Bytes), 2u);
}

TEST(CountTokensTest, TST_TOK_008_LargeFile_MoreTokensThanLines) {
    std::string text;
    for (int i = 0; i < 1000; ++i) {
        text += "print('line')\n";
    }

    EXPECT_GT(count_tokens(text, TokenScheme::Subword), 1000u);
    EXPECT_GT(count_tokens(text, TokenScheme::Bytes), 1000u);
}

// ==============================================================================
// analyze_text
// ==============================================================================

TEST(AnalyzeTextTest, TST_TOK_009_LineWordCharCounts) {
    FileStats stats = analyze_text("a b\n\nc\n", "sample.txt");

    EXPECT_EQ(stats.file_path, "sample.txt");
    EXPECT_EQ(stats.file_size, 7u);
    EXPECT_EQ(stats.line_count, 3u);
    EXPECT_EQ(stats.non_empty_line_count, 2u);
    EXPECT_EQ(stats.word_count, 3u);
    EXPECT_EQ(stats.char_count, 7u);
    // a, " b", "\n\n", c, "\n"
    EXPECT_EQ(stats.token_count, 5u);
    EXPECT_DOUBLE_EQ(stats.avg_tokens_per_line, 5.0 / 3.0);
    EXPECT_EQ(stats.small_lines_count, 2u);
    EXPECT_DOUBLE_EQ(stats.small_lines_percentage, 100.0);
}

TEST(AnalyzeTextTest, TST_TOK_010_Utf8_CharsAreCodePoints) {
    FileStats stats = analyze_text("h\xC3\xA9llo", "utf8.txt");

    EXPECT_EQ(stats.file_size, 6u);
    EXPECT_EQ(stats.char_count, 5u);
    EXPECT_EQ(stats.word_count, 1u);
    EXPECT_EQ(stats.line_count, 1u);
}

TEST(AnalyzeTextTest, TST_TOK_011_EmptyText_AllZero) {
    FileStats stats = analyze_text("", "empty.txt");

    EXPECT_EQ(stats.line_count, 0u);
    EXPECT_EQ(stats.token_count, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_tokens_per_line, 0.0);
    EXPECT_DOUBLE_EQ(stats.small_lines_percentage, 0.0);
    ASSERT_EQ(stats.context.size(), default_model_catalog().size());
    for (const auto& row : stats.context) {
        EXPECT_FALSE(row.exceeded);
    }
}

// ==============================================================================
// Контекстное окно
// ==============================================================================

TEST(ContextWindowTest, TST_TOK_012_PercentageAndExceeded) {
    std::vector<ModelLimit> catalog = {{"Small", 100}, {"Large", 1000}};

    auto at_limit = context_window_summary(100, catalog);
    auto over = context_window_summary(150, catalog);

    ASSERT_EQ(at_limit.size(), 2u);
    EXPECT_EQ(at_limit[0].model, "Small");
    EXPECT_DOUBLE_EQ(at_limit[0].percentage, 100.0);
    // Ровно на пределе - ещё помещается
    EXPECT_FALSE(at_limit[0].exceeded);
    EXPECT_DOUBLE_EQ(at_limit[1].percentage, 10.0);

    EXPECT_TRUE(over[0].exceeded);
    EXPECT_FALSE(over[1].exceeded);
    EXPECT_EQ(over[1].token_count, 150u);
}

// ==============================================================================
// analyze_file
// ==============================================================================

class AnalyzeFileTest : public codecollector::test::TempDirTest {};

TEST_F(AnalyzeFileTest, TST_TOK_013_ReadsFileAndRejectsMissing) {
    write_file(test_dir_ / "code.py", "def f():\n    return 1\n");

    FileStats stats = analyze_file(test_dir_ / "code.py");

    EXPECT_EQ(stats.line_count, 2u);
    EXPECT_EQ(stats.file_size, 22u);
    EXPECT_THROW(analyze_file(test_dir_ / "missing.py"), std::runtime_error);
    EXPECT_THROW(analyze_file(test_dir_), std::runtime_error);
    EXPECT_THROW(analyze_file(test_dir_ / "missing.py", default_model_catalog()),
                 std::runtime_error);
}

}  // namespace codecollector::analyse::test
