// ==============================================================================
// codecollector/collect.hpp - Конвейер сбора
// ==============================================================================
//
// Назначение:
// - Оркестрация: проверка кэша -> сканирование -> отчёт -> запись в кэш
// - Попадание в кэш обходит и сканер, и формирователь отчёта
// - Жёсткие ошибки (нет директории кэша, нельзя записать отчёт)
//   возвращаются явно через CollectResult
//
// Состояния одного вызова:
//   START -> CACHE_CHECK (use_cache) -> SCAN -> WRITE_REPORT
//         -> CACHE_STORE (use_cache) -> DONE
//
// ==============================================================================

#ifndef CODECOLLECTOR_COLLECT_HPP
#define CODECOLLECTOR_COLLECT_HPP

#include "codecollector/cache.hpp"
#include "codecollector/discovery.hpp"
#include "codecollector/pattern.hpp"
#include "codecollector/report.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace codecollector::collect {

/// Имя отчёта по умолчанию
constexpr const char* DEFAULT_OUTPUT = "collected_code.txt";

// ----------------------------------------------------------------------------
// Запрос
// ----------------------------------------------------------------------------

struct CollectRequest {
    std::filesystem::path root;
    io::PatternSet patterns;
    std::filesystem::path output = DEFAULT_OUTPUT;
    bool use_cache = true;
};

// ----------------------------------------------------------------------------
// Ошибки и результат
// ----------------------------------------------------------------------------

enum class CollectErrorKind {
    CacheUnavailable,   // директорию кэша нельзя создать
    ReportWriteFailed,  // формирователь не смог записать отчёт
    OutputWriteFailed   // отчёт нельзя скопировать в output
};

struct CollectError {
    CollectErrorKind kind = CollectErrorKind::ReportWriteFailed;
    std::string message;
};

struct CollectResult {
    bool ok = false;
    std::filesystem::path report_path;  // == request.output при ok
    std::size_t file_count = 0;
    bool cache_hit = false;
    std::string key;  // пусто при use_cache == false
    CollectError error;
};

const char* error_kind_to_string(CollectErrorKind kind);

// ----------------------------------------------------------------------------
// Pipeline
// ----------------------------------------------------------------------------

struct PipelineHooks {
    std::function<void(const std::string&)> warn;
    std::function<void(const std::string&)> debug;
};

class Pipeline {
public:
    /// cache и formatter принадлежат вызывающему и должны пережить Pipeline
    Pipeline(cache::CacheStore& cache, report::Formatter& formatter, PipelineHooks hooks = {});

    /// Выполнить сбор
    ///
    /// use_cache == true:
    /// - ключ = (корень, шаблоны, макет отчёта)
    /// - попадание (запись есть и артефакт существует): артефакт копируется
    ///   в output, сканирование и формирование отчёта не выполняются
    /// - промах: сканирование, отчёт в артефакт кэша, копия в output, запись
    ///   в индекс
    ///
    /// use_cache == false: сканирование и отчёт прямо в output, кэш не
    /// читается и не изменяется.
    ///
    /// Пустой результат сканирования - не ошибка: отчёт создаётся и кэшируется.
    CollectResult collect(const CollectRequest& request);

private:
    void debug(const std::string& message) const;
    void warn(const std::string& message) const;

    /// Скопировать отчёт в output (ничего не делает, если это один файл)
    bool deliver(const std::filesystem::path& from, const std::filesystem::path& to,
                 std::string& error) const;

    cache::CacheStore& cache_;
    report::Formatter& formatter_;
    PipelineHooks hooks_;
};

}  // namespace codecollector::collect

#endif  // CODECOLLECTOR_COLLECT_HPP
