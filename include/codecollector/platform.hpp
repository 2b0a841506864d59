// ==============================================================================
// codecollector/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Временные метки ISO-8601 для индекса кэша и отчётов
//
// Платформенная специфика (#ifdef _WIN32) изолирована в этом модуле.
//
// ==============================================================================

#ifndef CODECOLLECTOR_PLATFORM_HPP
#define CODECOLLECTOR_PLATFORM_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace codecollector::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из строки UTF-8 (на Windows через UTF-16)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

/// UTF-8 представление с разделителями '/' на всех платформах
/// Используется везде, где путь попадает в отчёт, индекс или хэш
std::string generic_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Локальное время в формате "YYYY-MM-DDTHH:MM:SS"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Текущее локальное время в формате ISO-8601
std::string now_iso8601();

}  // namespace codecollector::platform

#endif  // CODECOLLECTOR_PLATFORM_HPP
