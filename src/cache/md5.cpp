// ==============================================================================
// md5.cpp - MD5 (RFC 1321)
// ==============================================================================

#include "codecollector/md5.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace codecollector::cache {

namespace {

// Сдвиги по раундам
constexpr std::uint32_t S[64] = {
    7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22,
    5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20, 5, 9,  14, 20,
    4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23,
    6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21,
};

// K[i] = floor(|sin(i + 1)| * 2^32)
constexpr std::uint32_t K[64] = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee, 0xf57c0faf, 0x4787c62a, 0xa8304613,
    0xfd469501, 0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be, 0x6b901122, 0xfd987193,
    0xa679438e, 0x49b40821, 0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa, 0xd62f105d,
    0x02441453, 0xd8a1e681, 0xe7d3fbc8, 0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed,
    0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a, 0xfffa3942, 0x8771f681, 0x6d9d6122,
    0xfde5380c, 0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70, 0x289b7ec6, 0xeaa127fa,
    0xd4ef3085, 0x04881d05, 0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665, 0xf4292244,
    0x432aff97, 0xab9423a7, 0xfc93a039, 0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1, 0xf7537e82, 0xbd3af235, 0x2ad7d2bb,
    0xeb86d391,
};

constexpr std::size_t FILE_CHUNK = 64 * 1024;

inline std::uint32_t rotl(std::uint32_t x, std::uint32_t c) {
    return (x << c) | (x >> (32 - c));
}

}  // namespace

// ----------------------------------------------------------------------------
// Md5
// ----------------------------------------------------------------------------

Md5::Md5() {
    reset();
}

void Md5::reset() {
    state_ = {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476};
    buffer_.fill(0);
    length_ = 0;
}

void Md5::transform(const std::uint8_t block[64]) {
    std::uint32_t m[16];
    for (int i = 0; i < 16; ++i) {
        // Слова блока - little-endian
        m[i] = static_cast<std::uint32_t>(block[i * 4]) |
               (static_cast<std::uint32_t>(block[i * 4 + 1]) << 8) |
               (static_cast<std::uint32_t>(block[i * 4 + 2]) << 16) |
               (static_cast<std::uint32_t>(block[i * 4 + 3]) << 24);
    }

    std::uint32_t a = state_[0];
    std::uint32_t b = state_[1];
    std::uint32_t c = state_[2];
    std::uint32_t d = state_[3];

    for (int i = 0; i < 64; ++i) {
        std::uint32_t f = 0;
        int g = 0;
        if (i < 16) {
            f = (b & c) | (~b & d);
            g = i;
        } else if (i < 32) {
            f = (d & b) | (~d & c);
            g = (5 * i + 1) % 16;
        } else if (i < 48) {
            f = b ^ c ^ d;
            g = (3 * i + 5) % 16;
        } else {
            f = c ^ (b | ~d);
            g = (7 * i) % 16;
        }
        f = f + a + K[i] + m[g];
        a = d;
        d = c;
        c = b;
        b = b + rotl(f, S[i]);
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
}

void Md5::update(const void* data, std::size_t size) {
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    std::size_t offset = static_cast<std::size_t>(length_ % 64);
    length_ += size;

    // Дозаполняем буфер
    if (offset > 0) {
        std::size_t take = std::min(size, 64 - offset);
        std::memcpy(buffer_.data() + offset, bytes, take);
        offset += take;
        bytes += take;
        size -= take;
        if (offset < 64) {
            return;
        }
        transform(buffer_.data());
    }

    // Полные блоки напрямую из входа
    while (size >= 64) {
        transform(bytes);
        bytes += 64;
        size -= 64;
    }

    if (size > 0) {
        std::memcpy(buffer_.data(), bytes, size);
    }
}

Md5::Digest Md5::finalize() {
    const std::uint64_t bit_length = length_ * 8;

    // 0x80, нули до 56 mod 64, затем длина в битах (little-endian)
    static const std::uint8_t padding[64] = {0x80};
    std::size_t offset = static_cast<std::size_t>(length_ % 64);
    std::size_t pad_len = (offset < 56) ? (56 - offset) : (120 - offset);
    update(padding, pad_len);

    std::uint8_t len_bytes[8];
    for (int i = 0; i < 8; ++i) {
        len_bytes[i] = static_cast<std::uint8_t>(bit_length >> (8 * i));
    }
    update(len_bytes, 8);

    Digest digest{};
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            digest[static_cast<std::size_t>(i * 4 + j)] =
                static_cast<std::uint8_t>(state_[static_cast<std::size_t>(i)] >> (8 * j));
        }
    }
    return digest;
}

std::string Md5::to_hex(const Digest& digest) {
    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        result += hex[byte >> 4];
        result += hex[byte & 0x0f];
    }
    return result;
}

// ----------------------------------------------------------------------------
// Утилиты
// ----------------------------------------------------------------------------

std::string md5_hex(std::string_view data) {
    Md5 md5;
    md5.update(data);
    return Md5::to_hex(md5.finalize());
}

std::string md5_file_hex(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return {};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }

    Md5 md5;
    std::vector<char> chunk(FILE_CHUNK);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            md5.update(chunk.data(), static_cast<std::size_t>(got));
        }
    }
    if (file.bad()) {
        return {};
    }
    return Md5::to_hex(md5.finalize());
}

}  // namespace codecollector::cache
