// ==============================================================================
// codecollector/pattern.hpp - Отбор файлов по шаблонам
// ==============================================================================
//
// Назначение:
// - Набор шаблонов include / exclude / file_types (PatternSet)
// - Glob-сопоставление (*, ?, [...]) по компонентам пути
// - Фиксированные правила: скрытые записи и "шумовые" директории
// - Каталог расширений по умолчанию
//
// Все функции чистые: без побочных эффектов и разделяемого состояния.
//
// ==============================================================================

#ifndef CODECOLLECTOR_PATTERN_HPP
#define CODECOLLECTOR_PATTERN_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace codecollector::io {

// ----------------------------------------------------------------------------
// PatternSet
// ----------------------------------------------------------------------------

/// Три набора glob-шаблонов, управляющих отбором файлов
struct PatternSet {
    /// Строгий allow-list по имени файла. Если не пуст, остальные правила
    /// (кроме скрытых/шумовых директорий) не применяются
    std::vector<std::string> include;

    /// Шаблоны исключения (имя файла, компонент директории или путь)
    std::vector<std::string> exclude;

    /// Шаблоны типов файлов ("*.py"). Пусто = default_file_types()
    std::vector<std::string> file_types;
};

// ----------------------------------------------------------------------------
// Сопоставление
// ----------------------------------------------------------------------------

/// Glob-сопоставление всей строки text с pattern
///
/// - '*'   любая последовательность символов, кроме '/'
/// - '?'   ровно один символ, кроме '/'
/// - [abc], [a-z], [!a-z], [^a-z]  классы символов
/// - остальные символы сравниваются буквально (case-sensitive)
///
/// Незакрытая '[' трактуется как литерал.
bool glob_match(std::string_view pattern, std::string_view text);

/// Компонент пути скрыт (начинается с '.') или входит в denylist
bool is_noise_segment(std::string_view segment);

/// Решить, участвует ли файл в сборе
///
/// @param relative Путь файла относительно корня проекта
/// @param patterns Набор шаблонов
///
/// Порядок правил:
/// 1. Любой компонент скрыт или в denylist -> false
/// 2. include не пуст -> имя файла должно совпасть с одним из include
/// 3. Иначе имя файла должно совпасть с одним из file_types (или каталога
///    по умолчанию) и не совпасть ни с одним exclude
bool is_eligible(const std::filesystem::path& relative, const PatternSet& patterns);

/// Совпадает ли путь с одним из шаблонов исключения
bool is_excluded(const std::filesystem::path& relative, const std::vector<std::string>& exclude);

// ----------------------------------------------------------------------------
// Каталоги
// ----------------------------------------------------------------------------

/// Каталог типов файлов по умолчанию ("*.py", "*.js", ...)
const std::vector<std::string>& default_file_types();

/// Имена директорий, которые никогда не сканируются
const std::vector<std::string>& noise_directories();

/// Нормализовать тип файла из CLI: "py" и ".py" -> "*.py", glob без изменений
std::string normalize_file_type(std::string_view raw);

}  // namespace codecollector::io

#endif  // CODECOLLECTOR_PATTERN_HPP
