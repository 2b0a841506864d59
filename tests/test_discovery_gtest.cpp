// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска файлов проекта (GoogleTest)
// ==============================================================================
//
// Тесты: TST-DISC-001..TST-DISC-010
//
// ==============================================================================

#include "codecollector/discovery.hpp"

#include "test_fs.hpp"

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace codecollector::io::test {

class DiscoveryTest : public codecollector::test::TempDirTest {
protected:
    /// Пути результата относительно test_dir_, с '/'
    std::vector<std::string> relative(const ScanResult& result) const {
        std::vector<std::string> names;
        for (const auto& p : result) {
            names.push_back(p.lexically_relative(normalize_root(test_dir_)).generic_string());
        }
        return names;
    }

    /// Типичный проект: код, документация, скрытые и шумовые файлы
    void create_sample_project() {
        write_file(test_dir_ / "main.py", "print('main')\n");
        write_file(test_dir_ / "utils.py", "def helper():\n    pass\n");
        write_file(test_dir_ / "README.md", "# Project\n");
        write_file(test_dir_ / ".env", "SECRET=1\n");
        write_file(test_dir_ / "image.png", "\x89PNG");
        write_file(test_dir_ / "node_modules" / "pkg" / "index.js", "module.exports = {};\n");
        write_file(test_dir_ / ".git" / "config", "[core]\n");
        write_file(test_dir_ / "src" / "app.py", "app = None\n");
    }
};

// ==============================================================================
// TST-DISC-001: Шаблоны по умолчанию
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_001_DefaultPatterns_SkipHiddenAndNoise) {
    // Arrange
    create_sample_project();

    // Act
    auto result = scan(test_dir_, PatternSet{});

    // Assert - .env, .git, node_modules и png не попадают
    std::vector<std::string> expected = {"README.md", "main.py", "src/app.py", "utils.py"};
    EXPECT_EQ(relative(result), expected);
}

// ==============================================================================
// TST-DISC-002: Несуществующий корень
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_002_NonexistentRoot_EmptyResult) {
    auto result = scan(test_dir_ / "does_not_exist", PatternSet{});

    EXPECT_TRUE(result.empty());
}

// ==============================================================================
// TST-DISC-003: Корень - обычный файл
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_003_RootIsRegularFile_EmptyResult) {
    write_file(test_dir_ / "main.py");

    auto result = scan(test_dir_ / "main.py", PatternSet{});

    EXPECT_TRUE(result.empty());
}

// ==============================================================================
// TST-DISC-004: Пустая директория
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_004_EmptyDirectory_EmptyResult) {
    auto result = scan(test_dir_, PatternSet{});

    EXPECT_TRUE(result.empty());
}

// ==============================================================================
// TST-DISC-005: Результат - абсолютные пути по возрастанию
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_005_AbsoluteSortedUnique) {
    write_file(test_dir_ / "b" / "z.py");
    write_file(test_dir_ / "a" / "y.py");
    write_file(test_dir_ / "a.py");
    write_file(test_dir_ / "c.py");

    auto result = scan(test_dir_, PatternSet{});

    ASSERT_EQ(result.size(), 4u);
    for (const auto& p : result) {
        EXPECT_TRUE(p.is_absolute()) << p;
    }

    std::vector<std::string> as_strings;
    for (const auto& p : result) {
        as_strings.push_back(p.generic_string());
    }
    EXPECT_TRUE(std::is_sorted(as_strings.begin(), as_strings.end()));
    EXPECT_EQ(std::adjacent_find(as_strings.begin(), as_strings.end()), as_strings.end());
}

// ==============================================================================
// TST-DISC-006: Повторный обход даёт тот же результат
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_006_Deterministic) {
    create_sample_project();

    auto first = scan(test_dir_, PatternSet{});
    auto second = scan(test_dir_, PatternSet{});

    EXPECT_EQ(first, second);
}

// ==============================================================================
// TST-DISC-007: Исключение директории
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_007_ExcludeDirectory) {
    create_sample_project();
    write_file(test_dir_ / "tests" / "test_main.py");

    PatternSet patterns;
    patterns.exclude = {"tests/", "README.md"};

    auto result = scan(test_dir_, patterns);

    std::vector<std::string> expected = {"main.py", "src/app.py", "utils.py"};
    EXPECT_EQ(relative(result), expected);
}

// ==============================================================================
// TST-DISC-008: include как allow-list
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_008_IncludeOnly) {
    create_sample_project();

    PatternSet patterns;
    patterns.include = {"*.md"};

    auto result = scan(test_dir_, patterns);

    std::vector<std::string> expected = {"README.md"};
    EXPECT_EQ(relative(result), expected);
}

// ==============================================================================
// TST-DISC-009: Явные типы файлов
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_009_ExplicitFileTypes) {
    create_sample_project();
    write_file(test_dir_ / "notes.txt");

    PatternSet patterns;
    patterns.file_types = {"*.txt", "*.md"};

    auto result = scan(test_dir_, patterns);

    std::vector<std::string> expected = {"README.md", "notes.txt"};
    EXPECT_EQ(relative(result), expected);
}

// ==============================================================================
// TST-DISC-010: Ссылка на директорию не раскрывается
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_010_SymlinkedDirectory_NotFollowed) {
    write_file(test_dir_ / "real" / "inner.py");

    std::error_code ec;
    std::filesystem::create_directory_symlink(test_dir_ / "real", test_dir_ / "loop", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    auto result = scan(test_dir_, PatternSet{});

    std::vector<std::string> expected = {"real/inner.py"};
    EXPECT_EQ(relative(result), expected);
}

// ==============================================================================
// normalize_root
// ==============================================================================

TEST(NormalizeRootTest, TST_DISC_011_TrailingSeparatorRemoved) {
    auto root = std::filesystem::temp_directory_path() / "proj";
    auto with_slash = std::filesystem::path(root.string() + "/");

    EXPECT_EQ(normalize_root(with_slash), normalize_root(root));
    EXPECT_TRUE(normalize_root("relative/dir").is_absolute());
    EXPECT_EQ(normalize_root("relative/./dir/../dir").filename(), "dir");
}

}  // namespace codecollector::io::test
