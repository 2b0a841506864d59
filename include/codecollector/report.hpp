// ==============================================================================
// codecollector/report.hpp - Текстовый отчёт сбора
// ==============================================================================
//
// Назначение:
// - Formatter: интерфейс записи отчёта по ScanResult
// - TextFormatter: два макета (standard / indexed)
// - format_bytes: человекочитаемые размеры
//
// Заголовок отчёта (оба макета):
//
//   # Code Collection Report
//   Project Path: <root>
//   File Count: <n>
//   Generated At: <ISO-8601>
//   Total Size: <size>
//
// ==============================================================================

#ifndef CODECOLLECTOR_REPORT_HPP
#define CODECOLLECTOR_REPORT_HPP

#include "codecollector/discovery.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace codecollector::report {

// ----------------------------------------------------------------------------
// Layout
// ----------------------------------------------------------------------------

enum class Layout {
    Standard,  // "## File: <path>" + блок кода с тегом языка
    Indexed    // "####### [idx:N] <path>" ... "####### [end:N]"
};

/// "standard" / "indexed"
const char* layout_to_string(Layout layout);

/// Разобрать имя макета; nullopt для неизвестного
std::optional<Layout> parse_layout(std::string_view name);

// ----------------------------------------------------------------------------
// WriteStatus
// ----------------------------------------------------------------------------

struct WriteStatus {
    bool ok = false;
    std::string error;  // заполняется при ok == false
};

// ----------------------------------------------------------------------------
// Formatter
// ----------------------------------------------------------------------------

/// Интерфейс формирователя отчёта
/// Конвейер сбора знает только путь результата, не его содержимое
class Formatter {
public:
    virtual ~Formatter() = default;

    /// Записать отчёт по файлам files проекта root в out
    virtual WriteStatus write(const io::ScanResult& files, const std::filesystem::path& root,
                              const std::filesystem::path& out) = 0;

    /// Имя макета (входит в идентичность ключа кэша)
    virtual std::string name() const = 0;
};

// ----------------------------------------------------------------------------
// TextFormatter
// ----------------------------------------------------------------------------

class TextFormatter : public Formatter {
public:
    explicit TextFormatter(Layout layout = Layout::Standard) : layout_(layout) {}

    WriteStatus write(const io::ScanResult& files, const std::filesystem::path& root,
                      const std::filesystem::path& out) override;

    std::string name() const override { return layout_to_string(layout_); }

    Layout layout() const { return layout_; }

private:
    Layout layout_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "0.00 B", "1.50 KB", "1.00 MB", "1.00 GB", "1.00 TB"
/// Отрицательные значения сохраняют знак: "-100.00 B"
std::string format_bytes(std::int64_t bytes);

/// Тег языка для блока кода по имени файла ("py" -> "python"); "" если неизвестен
std::string language_tag(const std::filesystem::path& file);

}  // namespace codecollector::report

#endif  // CODECOLLECTOR_REPORT_HPP
