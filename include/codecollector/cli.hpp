// ==============================================================================
// codecollector/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в типизированную команду (std::variant)
// - Генерация --help / --version
// - Диагностика ошибок в стиле clap (exit code 2)
//
// ==============================================================================

#ifndef CODECOLLECTOR_CLI_HPP
#define CODECOLLECTOR_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace codecollector::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// collect - собрать файлы проекта в один отчёт
struct CollectCommand {
    std::filesystem::path path = ".";
    std::vector<std::string> include;     // -i, --include
    std::vector<std::string> exclude;     // -e, --exclude
    std::vector<std::string> file_types;  // -t, --file-type (уже glob)
    std::optional<std::filesystem::path> output;     // -o, --output
    bool no_cache = false;                           // --no-cache
    std::optional<std::filesystem::path> cache_dir;  // --cache-dir
    std::optional<std::string> format;               // --format (standard|indexed)
    std::optional<std::filesystem::path> config;     // --config
    bool no_analysis = false;                        // --no-analysis
};

/// analyze - статистика по файлам
struct AnalyzeCommand {
    std::vector<std::filesystem::path> files;
    bool json = false;  // --json
};

/// cache list
struct CacheListCommand {
    bool json = false;                               // --json
    std::optional<std::filesystem::path> cache_dir;  // --cache-dir
};

/// cache clear [PROJECT]
struct CacheClearCommand {
    std::optional<std::string> project;
    std::optional<std::filesystem::path> cache_dir;  // --cache-dir
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // "collect", "analyze", "cache", ...
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<CollectCommand, AnalyzeCommand, CacheListCommand,
                             CacheClearCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "codecollector";

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Collect project source files into a single report";

}  // namespace codecollector::cli

#endif  // CODECOLLECTOR_CLI_HPP
