// ==============================================================================
// codecollector/discovery.hpp - Поиск файлов проекта
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход корня проекта
// - Отбор файлов через io::is_eligible
// - Ранняя обрезка скрытых и "шумовых" директорий
// - Детерминированный порядок результата, без дубликатов
// - Мягкая обработка ошибок: недоступный корень -> пустой результат
//
// ==============================================================================

#ifndef CODECOLLECTOR_DISCOVERY_HPP
#define CODECOLLECTOR_DISCOVERY_HPP

#include "codecollector/pattern.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace codecollector::io {

/// Результат сканирования: абсолютные пути, строго по возрастанию, без повторов
using ScanResult = std::vector<std::filesystem::path>;

// ----------------------------------------------------------------------------
// ScanOptions
// ----------------------------------------------------------------------------

struct ScanOptions {
    /// Получатель предупреждений (директория недоступна и т.п.)
    /// Пустой callback = предупреждения отбрасываются
    std::function<void(const std::string&)> warn;
};

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

/// Найти все подходящие файлы под root
///
/// @param root Корень проекта (относительный путь приводится к абсолютному)
/// @param patterns Шаблоны отбора
/// @param opt Параметры (предупреждения)
/// @return Отсортированный список абсолютных путей
///
/// Поведение:
/// - root не существует, недоступен или не директория -> пустой результат
/// - Скрытые/шумовые директории не обходятся
/// - Символические ссылки на директории не раскрываются (защита от циклов)
/// - Ошибка чтения поддиректории пропускает только это поддерево
///
/// Исключений не бросает.
ScanResult scan(const std::filesystem::path& root, const PatternSet& patterns,
                const ScanOptions& opt = {});

/// Абсолютный нормализованный путь корня (без завершающего разделителя)
/// Для несуществующего пути возвращает лексически нормализованный absolute()
std::filesystem::path normalize_root(const std::filesystem::path& root);

}  // namespace codecollector::io

#endif  // CODECOLLECTOR_DISCOVERY_HPP
