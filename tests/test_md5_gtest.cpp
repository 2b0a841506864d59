// ==============================================================================
// test_md5_gtest.cpp - Тесты MD5 (GoogleTest)
// ==============================================================================
//
// Векторы RFC 1321 и потоковое обновление.
//
// ==============================================================================

#include "codecollector/md5.hpp"

#include "test_fs.hpp"

#include <gtest/gtest.h>
#include <string>

namespace codecollector::cache::test {

TEST(Md5Test, TST_MD5_001_Rfc1321Vectors) {
    EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex("a"), "0cc175b9c0f1b6a831c399e269772661");
    EXPECT_EQ(md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5_hex("message digest"), "f96b697d7cb7938d525a2f31aaf161d0");
    EXPECT_EQ(md5_hex("abcdefghijklmnopqrstuvwxyz"), "c3fcd3d76192e4007dfb496cca67e13b");
    EXPECT_EQ(md5_hex("12345678901234567890123456789012345678901234567890123456789012345678901234"
                      "567890"),
              "57edf4a22be3c955ac49da2e2107b67a");
}

TEST(Md5Test, TST_MD5_002_KnownSentence) {
    EXPECT_EQ(md5_hex("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5Test, TST_MD5_003_MultiBlockInput) {
    EXPECT_EQ(md5_hex(std::string(1000, 'a')), "cabe45dcc9ae5b66ba86600cca6b8ba8");
}

TEST(Md5Test, TST_MD5_004_IncrementalUpdate_SameAsOneShot) {
    const std::string data = "The quick brown fox jumps over the lazy dog";

    // Куски на границах, не кратных 64
    Md5 md5;
    md5.update(std::string_view(data).substr(0, 7));
    md5.update(std::string_view(data).substr(7, 30));
    md5.update(std::string_view(data).substr(37));

    EXPECT_EQ(Md5::to_hex(md5.finalize()), md5_hex(data));
}

TEST(Md5Test, TST_MD5_005_ResetStartsOver) {
    Md5 md5;
    md5.update("garbage");
    md5.reset();
    md5.update("abc");

    EXPECT_EQ(Md5::to_hex(md5.finalize()), "900150983cd24fb0d6963f7d28e17f72");
}

// ==============================================================================
// md5_file_hex
// ==============================================================================

class Md5FileTest : public codecollector::test::TempDirTest {};

TEST_F(Md5FileTest, TST_MD5_006_FileHash_MatchesContent) {
    write_file(test_dir_ / "a.txt", "abc");

    std::string hash = md5_file_hex(test_dir_ / "a.txt");

    EXPECT_EQ(hash, "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hash.size(), 32u);
}

TEST_F(Md5FileTest, TST_MD5_007_MissingFile_EmptyString) {
    EXPECT_EQ(md5_file_hex(test_dir_ / "missing.txt"), "");
    // Директория - не обычный файл
    EXPECT_EQ(md5_file_hex(test_dir_), "");
}

TEST_F(Md5FileTest, TST_MD5_008_LargeFile_ChunkedRead) {
    // Больше одного 64 KiB блока чтения
    std::string content(200000, 'x');
    write_file(test_dir_ / "big.bin", content);

    EXPECT_EQ(md5_file_hex(test_dir_ / "big.bin"), md5_hex(content));
}

}  // namespace codecollector::cache::test
