// ==============================================================================
// codecollector/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~] и уровнями -q / -v
// - Таблицы (Unicode box-drawing) и JSON (RapidJSON)
// - Цвета ANSI только для TTY
//
// Библиотечные модули ничего не печатают сами: предупреждения сканера и
// кэша приходят сюда через колбэки, которые подключает app.
//
// ==============================================================================

#ifndef CODECOLLECTOR_OUTPUT_HPP
#define CODECOLLECTOR_OUTPUT_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace codecollector::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // информация
    Yellow,  // предупреждения
    Red,     // ошибки
    Cyan,    // отладка
    Magenta  // трассировка
};

struct OutputConfig {
    bool quiet = false;      // -q: подавить [+] и [!]
    int verbose = 0;         // -v: 1 = [*], 2+ = [~]
    bool no_banner = false;  // --no-banner
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);

    /// Перенаправить потоки (тесты); nullptr = stdout/stderr процесса
    Writer(const OutputConfig& cfg, FILE* out, FILE* err);

    ~Writer();

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr, кроме quiet
    void info(std::string_view message);

    /// "[!] <message>" в stderr, кроме quiet
    void warn(std::string_view message);

    /// "[x] <message>" в stderr, всегда
    void error(std::string_view message);

    /// "[*] <message>" при verbose >= 1
    void debug(std::string_view message);

    /// "[~] <message>" при verbose >= 2
    void trace(std::string_view message);

    /// JSON с отступами + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void prefixed(std::string_view prefix, Color color, std::string_view message);
    FILE* get_file(Stream s) const;
    bool colored(Stream s) const;

    OutputConfig config_;
    FILE* out_ = nullptr;
    FILE* err_ = nullptr;
    bool redirected_ = false;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

enum class Align { Left, Right };

class Table {
public:
    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Выравнивание столбца (по умолчанию Left)
    void set_align(std::size_t col, Align align);

    void print(Writer& w) const;
    std::string to_string() const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::size_t> widths() const;
    std::string format_line(const std::vector<std::size_t>& widths, const char* left,
                            const char* middle, const char* right) const;
    std::string format_row(const std::vector<std::size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<Align> align_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Ширина строки в кодовых точках UTF-8
std::size_t display_width(std::string_view text);

/// Число с разделителями тысяч: 1234567 -> "1,234,567"
std::string format_count(std::uint64_t value);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace codecollector::output

#endif  // CODECOLLECTOR_OUTPUT_HPP
