// ==============================================================================
// config.cpp - Файл конфигурации проекта
// ==============================================================================

#include "codecollector/config.hpp"

#include "codecollector/pattern.hpp"
#include "codecollector/platform.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace codecollector::config {

namespace {

/// Последовательность строк; ошибка типа сообщается через error
std::optional<std::vector<std::string>> parse_string_list(const YAML::Node& node,
                                                          const char* key,
                                                          std::string& error) {
    if (!node.IsSequence()) {
        error = std::string("'") + key + "' must be a list of strings";
        return std::nullopt;
    }
    std::vector<std::string> items;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            error = std::string("'") + key + "' must be a list of strings";
            return std::nullopt;
        }
        items.push_back(item.as<std::string>());
    }
    return items;
}

std::optional<std::vector<analyse::ModelLimit>> parse_models(const YAML::Node& node,
                                                             std::string& error) {
    if (!node.IsSequence()) {
        error = "'models' must be a list of {name, limit} mappings";
        return std::nullopt;
    }
    std::vector<analyse::ModelLimit> models;
    for (const auto& item : node) {
        if (!item.IsMap() || !item["name"] || !item["limit"]) {
            error = "'models' entries require 'name' and 'limit'";
            return std::nullopt;
        }
        analyse::ModelLimit model;
        model.name = item["name"].as<std::string>();
        model.limit = item["limit"].as<std::uint64_t>();
        if (model.limit == 0) {
            error = "model '" + model.name + "' has zero limit";
            return std::nullopt;
        }
        models.push_back(std::move(model));
    }
    return models;
}

}  // namespace

ConfigResult parse_config(const std::string& yaml, const std::string& source) {
    ConfigResult result;

    try {
        YAML::Node root = YAML::Load(yaml);

        // Пустой файл = пустая конфигурация
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = source + ": top level must be a mapping";
            return result;
        }

        std::string error;
        Config& cfg = result.config;

        if (root["include"]) {
            cfg.include = parse_string_list(root["include"], "include", error);
        }
        if (error.empty() && root["exclude"]) {
            cfg.exclude = parse_string_list(root["exclude"], "exclude", error);
        }
        if (error.empty() && root["file_types"]) {
            cfg.file_types = parse_string_list(root["file_types"], "file_types", error);
        }
        if (error.empty() && root["models"]) {
            cfg.models = parse_models(root["models"], error);
        }
        if (!error.empty()) {
            result.error = source + ": " + error;
            return result;
        }

        if (root["cache_dir"]) {
            cfg.cache_dir = platform::path_from_utf8(root["cache_dir"].as<std::string>());
        }
        if (root["use_cache"]) {
            cfg.use_cache = root["use_cache"].as<bool>();
        }
        if (root["layout"]) {
            const std::string name = root["layout"].as<std::string>();
            auto layout = report::parse_layout(name);
            if (!layout) {
                result.error = source + ": invalid layout '" + name +
                               "' (expected 'standard' or 'indexed')";
                return result;
            }
            cfg.layout = *layout;
        }

        // Типы file_types приводятся к glob сразу
        if (cfg.file_types) {
            for (auto& ft : *cfg.file_types) {
                ft = io::normalize_file_type(ft);
            }
        }

        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error = source + ": YAML parse error: " + e.what();
        return result;
    }
}

ConfigResult load_config(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ConfigResult result;
        result.error = "cannot open config file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse_config(content.str(), platform::path_to_utf8(path));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path& root) {
    std::filesystem::path candidate = root / PROJECT_CONFIG_NAME;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
        return candidate;
    }
    return std::nullopt;
}

}  // namespace codecollector::config
