// ==============================================================================
// codecollector/cache.hpp - Кэш результатов сбора
// ==============================================================================
//
// Назначение:
// - Ключ кэша: <slug>_<hash> от (корень, include, exclude, file_types)
// - Индекс ключ -> CacheEntry в JSON-документе cache_index.json
// - Артефакты cache_<key>.txt в директории кэша
// - Создание / замещение / очистка / перечисление записей
//
// Индекс загружается в конструкторе и сохраняется после каждой мутации.
// Повреждённый индекс = пустой кэш (предупреждение, не ошибка).
// Запись индекса: временный файл + rename (атомарная замена).
//
// RapidJSON для сериализации индекса.
//
// ==============================================================================

#ifndef CODECOLLECTOR_CACHE_HPP
#define CODECOLLECTOR_CACHE_HPP

#include "codecollector/pattern.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codecollector::cache {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Директория кэша по умолчанию
constexpr const char* DEFAULT_CACHE_DIR = ".code_cache";

/// Имя документа индекса в директории кэша
constexpr const char* INDEX_FILE_NAME = "cache_index.json";

/// Длина hash-части ключа (усечённый MD5)
constexpr std::size_t PROJECT_HASH_LENGTH = 16;

// ----------------------------------------------------------------------------
// CacheEntry
// ----------------------------------------------------------------------------

/// Запись индекса кэша
struct CacheEntry {
    std::string key;
    std::string report_file;   // имя артефакта в директории кэша
    std::string project_path;  // абсолютный путь корня проекта
    std::string created_at;    // ISO-8601
    std::uint64_t file_count = 0;
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class CacheErrorKind {
    DirectoryUnavailable,  // директорию кэша нельзя создать
    IndexWriteFailed,      // индекс нельзя записать
    ArtifactWriteFailed    // артефакт нельзя записать/скопировать
};

struct CacheError {
    CacheErrorKind kind = CacheErrorKind::DirectoryUnavailable;
    std::string message;

    /// "failed to create cache directory '<dir>' - <reason>"
    std::string format() const { return message; }
};

/// Результат мутирующей операции
struct CacheResult {
    bool ok = false;
    CacheError error;
};

/// Результат clear()
struct ClearResult {
    bool ok = false;
    std::size_t removed = 0;  // удалено записей индекса
    CacheError error;
};

// ----------------------------------------------------------------------------
// CacheConfig
// ----------------------------------------------------------------------------

struct CacheConfig {
    std::filesystem::path cache_dir = DEFAULT_CACHE_DIR;

    /// Получатель предупреждений (повреждённый индекс, неудалённый артефакт)
    std::function<void(const std::string&)> warn;
};

// ----------------------------------------------------------------------------
// CacheStore
// ----------------------------------------------------------------------------

class CacheStore {
public:
    explicit CacheStore(CacheConfig cfg);

    // Ключи и хэши
    // -------------------------------------------------------------------------

    /// Отпечаток (корень, шаблоны): первые 16 hex-символов MD5
    ///
    /// Шаблоны сортируются и дедуплицируются перед хэшированием: порядок
    /// не влияет на результат, состав - влияет.
    /// variant - дополнительный компонент идентичности (формат отчёта);
    /// пустой variant в хэш не входит.
    static std::string compute_project_hash(const std::filesystem::path& root,
                                            const std::vector<std::string>& include,
                                            const std::vector<std::string>& exclude,
                                            const std::vector<std::string>& file_types,
                                            std::string_view variant = {});

    /// Безопасное для ФС имя проекта: последний компонент корня в нижнем
    /// регистре, символы вне [a-z0-9_-] заменены на '_'
    static std::string project_slug(const std::filesystem::path& root);

    /// <slug>_<hash>
    static std::string make_key(const std::filesystem::path& root, const io::PatternSet& patterns,
                                std::string_view variant = {});

    /// cache_<key>.txt
    static std::string artifact_name(const std::string& key);

    /// MD5 содержимого файла; "" для отсутствующего/нечитаемого файла
    static std::string file_hash(const std::filesystem::path& path);

    // Индекс
    // -------------------------------------------------------------------------

    /// Поиск в памяти, без обращения к ФС
    std::optional<CacheEntry> lookup(const std::string& key) const;

    /// Записать/заменить запись и сохранить индекс
    /// report_file обязан совпадать с artifact_name(key)
    CacheResult store(const CacheEntry& entry);

    /// Удалить все записи (prefix == nullopt) или записи с ключом,
    /// начинающимся с prefix. Артефакты удаляемых записей удаляются.
    /// Полная очистка также удаляет осиротевшие cache_*.txt
    ClearResult clear(const std::optional<std::string>& prefix = std::nullopt);

    /// Перечитать индекс с диска и вернуть записи, упорядоченные по ключу
    std::vector<CacheEntry> list();

    /// Количество записей в памяти
    std::size_t size() const { return index_.size(); }

    // Артефакты и директория
    // -------------------------------------------------------------------------

    /// Путь артефакта записи (выводится только из CacheEntry)
    std::filesystem::path artifact_path(const CacheEntry& entry) const;

    /// Создать директорию кэша при необходимости
    CacheResult ensure_directory();

    const std::filesystem::path& directory() const { return dir_; }
    const std::filesystem::path& index_path() const { return index_path_; }

private:
    void load_index();
    CacheResult save_index();
    void remove_artifact(const std::string& file_name);
    void warn(const std::string& message) const;

    CacheConfig config_;
    std::filesystem::path dir_;
    std::filesystem::path index_path_;
    std::unordered_map<std::string, CacheEntry> index_;
};

}  // namespace codecollector::cache

#endif  // CODECOLLECTOR_CACHE_HPP
