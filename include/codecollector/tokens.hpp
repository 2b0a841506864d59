// ==============================================================================
// codecollector/tokens.hpp - Статистика файлов и оценка токенов
// ==============================================================================
//
// Назначение:
// - Размер, строки, символы, слова файла
// - Две эвристические схемы подсчёта токенов (без внешнего токенизатора)
// - Таблица заполнения контекстного окна известных моделей
//
// Модуль не зависит от сканера и кэша; вызывается только для анализа
// отдельных файлов (в том числе готового отчёта).
//
// ==============================================================================

#ifndef CODECOLLECTOR_TOKENS_HPP
#define CODECOLLECTOR_TOKENS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace codecollector::analyse {

// ----------------------------------------------------------------------------
// Каталог моделей
// ----------------------------------------------------------------------------

struct ModelLimit {
    std::string name;
    std::uint64_t limit = 0;  // размер контекстного окна в токенах
};

/// Встроенный каталог (порядок = порядок строк таблицы)
const std::vector<ModelLimit>& default_model_catalog();

/// Строка таблицы контекстного окна
struct ContextUsage {
    std::string model;
    std::uint64_t limit = 0;
    std::uint64_t token_count = 0;
    double percentage = 0.0;  // token_count / limit * 100
    bool exceeded = false;    // token_count > limit
};

/// Таблица заполнения для token_count по каталогу (порядок каталога)
std::vector<ContextUsage> context_window_summary(std::uint64_t token_count,
                                                 const std::vector<ModelLimit>& catalog);

// ----------------------------------------------------------------------------
// Токены
// ----------------------------------------------------------------------------

enum class TokenScheme {
    Subword,  // буквенные серии режутся на куски по 6 символов
    Bytes     // ceil(байты / 4) на пре-токен
};

/// Разбить текст на пре-токены
///
/// - серия букв (включая байты UTF-8 >= 0x80) с одним ведущим пробелом
/// - серия цифр, не длиннее 3
/// - одиночный знак пунктуации с одним ведущим пробелом
/// - серия пробельных символов (без ведущего пробела следующего токена)
std::vector<std::string_view> pretokenize(std::string_view text);

/// Оценить число токенов текста
std::uint64_t count_tokens(std::string_view text, TokenScheme scheme);

// ----------------------------------------------------------------------------
// FileStats
// ----------------------------------------------------------------------------

/// Граница "короткой" строки в токенах (Subword)
constexpr std::uint64_t SMALL_LINE_TOKENS = 5;

struct FileStats {
    std::string file_path;
    std::uint64_t file_size = 0;  // байты
    std::uint64_t line_count = 0;
    std::uint64_t non_empty_line_count = 0;
    std::uint64_t char_count = 0;  // кодовые точки UTF-8
    std::uint64_t word_count = 0;
    std::uint64_t token_count = 0;       // TokenScheme::Subword
    std::uint64_t token_count_gpt4 = 0;  // TokenScheme::Bytes
    double avg_tokens_per_line = 0.0;
    std::uint64_t small_lines_count = 0;
    double small_lines_percentage = 0.0;
    std::vector<ContextUsage> context;
};

/// Статистика по тексту (без чтения файла)
FileStats analyze_text(std::string_view text, const std::string& file_path,
                       const std::vector<ModelLimit>& catalog = default_model_catalog());

/// Прочитать файл и посчитать статистику
/// @throws std::runtime_error если файл не существует или не читается
FileStats analyze_file(const std::filesystem::path& path,
                       const std::vector<ModelLimit>& catalog = default_model_catalog());

}  // namespace codecollector::analyse

#endif  // CODECOLLECTOR_TOKENS_HPP
