// ==============================================================================
// codecollector/config.hpp - Файл конфигурации проекта
// ==============================================================================
//
// Назначение:
// - Загрузка YAML-конфигурации (--config или .codecollector.yml в корне)
// - Слияние с опциями командной строки (CLI имеет приоритет)
//
// Все ключи необязательны. Неизвестные ключи игнорируются, ключ неверного
// типа - ошибка загрузки.
//
//   include:    [ "*.py" ]
//   exclude:    [ "tests/" ]
//   file_types: [ "py", "*.md" ]
//   cache_dir:  .code_cache
//   use_cache:  true
//   layout:     standard | indexed
//   models:
//     - { name: "GPT-4o", limit: 128000 }
//
// ==============================================================================

#ifndef CODECOLLECTOR_CONFIG_HPP
#define CODECOLLECTOR_CONFIG_HPP

#include "codecollector/report.hpp"
#include "codecollector/tokens.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codecollector::config {

/// Имя файла, который ищется в корне проекта
constexpr const char* PROJECT_CONFIG_NAME = ".codecollector.yml";

/// Значения из файла; отсутствующий ключ = std::nullopt
struct Config {
    std::optional<std::vector<std::string>> include;
    std::optional<std::vector<std::string>> exclude;
    std::optional<std::vector<std::string>> file_types;
    std::optional<std::filesystem::path> cache_dir;
    std::optional<bool> use_cache;
    std::optional<report::Layout> layout;
    std::optional<std::vector<analyse::ModelLimit>> models;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из строки YAML (source - для сообщений об ошибках)
ConfigResult parse_config(const std::string& yaml, const std::string& source);

/// Путь конфигурации проекта, если файл существует
std::optional<std::filesystem::path> find_project_config(const std::filesystem::path& root);

}  // namespace codecollector::config

#endif  // CODECOLLECTOR_CONFIG_HPP
