// ==============================================================================
// test_fs.hpp - Временные директории для тестов
// ==============================================================================
//
// Уникальное имя = префикс + имя теста + PID: ctest -j запускает наборы
// параллельно, и общие директории приводили бы к гонкам.
//
// ==============================================================================

#ifndef CODECOLLECTOR_TEST_FS_HPP
#define CODECOLLECTOR_TEST_FS_HPP

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

#ifdef _WIN32
#include <process.h>
#define CODECOLLECTOR_TEST_PID _getpid()
#else
#include <unistd.h>
#define CODECOLLECTOR_TEST_PID getpid()
#endif

namespace codecollector::test {

class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("codecollector_") + test_info->test_suite_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(CODECOLLECTOR_TEST_PID);

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /// Создать файл (и родительские директории) с содержимым
    void write_file(const std::filesystem::path& path, const std::string& content = "content") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
};

}  // namespace codecollector::test

#endif  // CODECOLLECTOR_TEST_FS_HPP
