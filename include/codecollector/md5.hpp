// ==============================================================================
// codecollector/md5.hpp - MD5 дайджесты
// ==============================================================================
//
// Назначение:
// - Хэш содержимого файла (FileContentHash, 32 hex-символа)
// - Хэш строки для ключей кэша
//
// Реализация автономная (RFC 1321), без OpenSSL.
//
// ==============================================================================

#ifndef CODECOLLECTOR_MD5_HPP
#define CODECOLLECTOR_MD5_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace codecollector::cache {

// ----------------------------------------------------------------------------
// Md5 - потоковый вычислитель
// ----------------------------------------------------------------------------

class Md5 {
public:
    using Digest = std::array<std::uint8_t, 16>;

    Md5();

    /// Добавить данные
    void update(const void* data, std::size_t size);
    void update(std::string_view data) { update(data.data(), data.size()); }

    /// Завершить вычисление. После вызова объект нужно reset()
    Digest finalize();

    /// Сбросить состояние
    void reset();

    /// Digest -> 32 hex-символа в нижнем регистре
    static std::string to_hex(const Digest& digest);

private:
    void transform(const std::uint8_t block[64]);

    std::array<std::uint32_t, 4> state_{};
    std::array<std::uint8_t, 64> buffer_{};
    std::uint64_t length_ = 0;  // байт обработано всего
};

// ----------------------------------------------------------------------------
// Утилиты
// ----------------------------------------------------------------------------

/// MD5 строки в hex
std::string md5_hex(std::string_view data);

/// MD5 содержимого файла в hex
/// Несуществующий или нечитаемый файл -> пустая строка (не ошибка)
std::string md5_file_hex(const std::filesystem::path& path);

}  // namespace codecollector::cache

#endif  // CODECOLLECTOR_MD5_HPP
