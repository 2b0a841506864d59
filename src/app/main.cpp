// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются только здесь, на границе app.
//
// ==============================================================================

#include "codecollector/cache.hpp"
#include "codecollector/cli.hpp"
#include "codecollector/collect.hpp"
#include "codecollector/config.hpp"
#include "codecollector/output.hpp"
#include "codecollector/platform.hpp"
#include "codecollector/report.hpp"
#include "codecollector/tokens.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <rapidjson/document.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

using namespace codecollector;

constexpr const char* BANNER = R"(
   ___          _          ___      _ _           _
  / __|___  __| |___     / __|___ | | |___ __ __| |_ ___ _ _
 | (__/ _ \/ _` / -_)   | (__/ _ \| | / -_) _/ _|  _/ _ \ '_|
  \___\___/\__,_\___|    \___\___/|_|_\___\__\__|\__\___/_|
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

std::string format_fixed(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

// ----------------------------------------------------------------------------
// Представление статистики
// ----------------------------------------------------------------------------

void print_stats(output::Writer& writer, const analyse::FileStats& stats) {
    using output::format_count;
    const auto line = [&](const std::string& text) {
        writer.write_line(output::Stream::Stdout, text);
    };

    line("File: " + stats.file_path);
    line("  Size:             " + report::format_bytes(static_cast<std::int64_t>(stats.file_size)));
    line("  Lines:            " + format_count(stats.line_count) +
         " (non-empty: " + format_count(stats.non_empty_line_count) + ")");
    line("  Characters:       " + format_count(stats.char_count));
    line("  Words:            " + format_count(stats.word_count));
    line("  Tokens:           " + format_count(stats.token_count) +
         " (byte estimate: " + format_count(stats.token_count_gpt4) + ")");
    line("  Tokens per line:  " + format_fixed(stats.avg_tokens_per_line));
    line("  Small lines:      " + format_count(stats.small_lines_count) + " (" +
         format_fixed(stats.small_lines_percentage) + "%)");
    line("");

    output::Table table;
    table.set_headers({"Model", "Context", "Used", "Status"});
    table.set_align(1, output::Align::Right);
    table.set_align(2, output::Align::Right);
    for (const auto& row : stats.context) {
        table.add_row({row.model, format_count(row.limit), format_fixed(row.percentage) + "%",
                       row.exceeded ? "exceeds" : "fits"});
    }
    table.print(writer);
}

rapidjson::Value stats_to_json(const analyse::FileStats& stats,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("file_path", rapidjson::Value(stats.file_path.c_str(), alloc), alloc);
    obj.AddMember("file_size", stats.file_size, alloc);
    obj.AddMember("line_count", stats.line_count, alloc);
    obj.AddMember("non_empty_line_count", stats.non_empty_line_count, alloc);
    obj.AddMember("char_count", stats.char_count, alloc);
    obj.AddMember("word_count", stats.word_count, alloc);
    obj.AddMember("token_count", stats.token_count, alloc);
    obj.AddMember("token_count_gpt4", stats.token_count_gpt4, alloc);
    obj.AddMember("avg_tokens_per_line", stats.avg_tokens_per_line, alloc);
    obj.AddMember("small_lines_count", stats.small_lines_count, alloc);
    obj.AddMember("small_lines_percentage", stats.small_lines_percentage, alloc);

    rapidjson::Value context(rapidjson::kArrayType);
    for (const auto& row : stats.context) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("model", rapidjson::Value(row.model.c_str(), alloc), alloc);
        item.AddMember("limit", row.limit, alloc);
        item.AddMember("percentage", row.percentage, alloc);
        item.AddMember("exceeded", row.exceeded, alloc);
        context.PushBack(item, alloc);
    }
    obj.AddMember("context_analysis", context, alloc);
    return obj;
}

// ----------------------------------------------------------------------------
// collect
// ----------------------------------------------------------------------------

int run_collect(const cli::CollectCommand& cmd, output::Writer& writer) {
    const std::filesystem::path root = cmd.path;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        writer.warn("project path is not a directory: " + platform::path_to_utf8(root));
    }

    // Конфигурация: --config или .codecollector.yml в корне проекта
    config::Config cfg;
    std::optional<std::filesystem::path> config_path = cmd.config;
    if (!config_path) {
        config_path = config::find_project_config(root);
    }
    if (config_path) {
        config::ConfigResult loaded = config::load_config(*config_path);
        if (!loaded.ok) {
            writer.error(loaded.error);
            return 1;
        }
        writer.debug("loaded config: " + platform::path_to_utf8(*config_path));
        cfg = std::move(loaded.config);
    }

    // Слияние: значения CLI замещают значения файла
    collect::CollectRequest request;
    request.root = root;
    request.patterns.include = !cmd.include.empty() ? cmd.include : cfg.include.value_or(
                                                                        std::vector<std::string>{});
    request.patterns.exclude = !cmd.exclude.empty() ? cmd.exclude : cfg.exclude.value_or(
                                                                        std::vector<std::string>{});
    request.patterns.file_types =
        !cmd.file_types.empty() ? cmd.file_types
                                : cfg.file_types.value_or(std::vector<std::string>{});
    request.output = cmd.output.value_or(std::filesystem::path(collect::DEFAULT_OUTPUT));
    request.use_cache = !cmd.no_cache && cfg.use_cache.value_or(true);

    report::Layout layout = cfg.layout.value_or(report::Layout::Standard);
    if (cmd.format) {
        if (auto parsed = report::parse_layout(*cmd.format)) {
            layout = *parsed;
        }
    }

    cache::CacheConfig cache_cfg;
    cache_cfg.cache_dir = cmd.cache_dir ? *cmd.cache_dir
                                        : cfg.cache_dir.value_or(cache::DEFAULT_CACHE_DIR);
    cache_cfg.warn = [&writer](const std::string& m) { writer.warn(m); };

    writer.info("Collecting files from: " + platform::path_to_utf8(root) +
                " (layout: " + report::layout_to_string(layout) +
                ", cache: " + (request.use_cache ? "on" : "off") + ")");

    cache::CacheStore store(cache_cfg);
    report::TextFormatter formatter(layout);

    collect::PipelineHooks hooks;
    hooks.warn = [&writer](const std::string& m) { writer.warn(m); };
    hooks.debug = [&writer](const std::string& m) { writer.debug(m); };

    collect::Pipeline pipeline(store, formatter, hooks);
    collect::CollectResult result = pipeline.collect(request);

    if (!result.ok) {
        writer.error(std::string(collect::error_kind_to_string(result.error.kind)) + ": " +
                     result.error.message);
        return 1;
    }

    if (result.cache_hit) {
        writer.info("Using cached collection " + result.key + " (" +
                    std::to_string(result.file_count) + " files)");
    } else {
        writer.info("Collected " + std::to_string(result.file_count) + " files");
    }
    writer.info("Report written to: " + platform::path_to_utf8(result.report_path));

    if (!cmd.no_analysis) {
        const auto& catalog = cfg.models ? *cfg.models : analyse::default_model_catalog();
        try {
            analyse::FileStats stats = analyse::analyze_file(result.report_path, catalog);
            print_stats(writer, stats);
        } catch (const std::runtime_error& e) {
            // Отчёт уже записан: сбой анализа не меняет код выхода
            writer.warn(std::string("report analysis failed: ") + e.what());
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// analyze
// ----------------------------------------------------------------------------

int run_analyze(const cli::AnalyzeCommand& cmd, output::Writer& writer) {
    int exit_code = 0;

    rapidjson::Document doc(rapidjson::kArrayType);
    auto& alloc = doc.GetAllocator();

    bool first = true;
    for (const auto& file : cmd.files) {
        analyse::FileStats stats;
        try {
            stats = analyse::analyze_file(file);
        } catch (const std::runtime_error& e) {
            writer.error(e.what());
            exit_code = 1;
            continue;
        }

        if (cmd.json) {
            rapidjson::Value item = stats_to_json(stats, alloc);
            doc.PushBack(item, alloc);
        } else {
            if (!first) {
                writer.write_line(output::Stream::Stdout, "");
            }
            print_stats(writer, stats);
        }
        first = false;
    }

    if (cmd.json) {
        writer.write_json_pretty(doc);
    }
    return exit_code;
}

// ----------------------------------------------------------------------------
// cache list / cache clear
// ----------------------------------------------------------------------------

cache::CacheConfig cache_config(const std::optional<std::filesystem::path>& dir,
                                output::Writer& writer) {
    cache::CacheConfig cfg;
    if (dir) {
        cfg.cache_dir = *dir;
    }
    cfg.warn = [&writer](const std::string& m) { writer.warn(m); };
    return cfg;
}

int run_cache_list(const cli::CacheListCommand& cmd, output::Writer& writer) {
    cache::CacheStore store(cache_config(cmd.cache_dir, writer));
    const std::vector<cache::CacheEntry> entries = store.list();

    if (cmd.json) {
        rapidjson::Document doc(rapidjson::kArrayType);
        auto& alloc = doc.GetAllocator();
        for (const auto& entry : entries) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("key", rapidjson::Value(entry.key.c_str(), alloc), alloc);
            obj.AddMember("file", rapidjson::Value(entry.report_file.c_str(), alloc), alloc);
            obj.AddMember("project_path", rapidjson::Value(entry.project_path.c_str(), alloc),
                          alloc);
            obj.AddMember("created_at", rapidjson::Value(entry.created_at.c_str(), alloc), alloc);
            obj.AddMember("file_count", entry.file_count, alloc);
            doc.PushBack(obj, alloc);
        }
        writer.write_json_pretty(doc);
        return 0;
    }

    if (entries.empty()) {
        writer.info("Cache is empty: " + platform::path_to_utf8(store.directory()));
        return 0;
    }

    output::Table table;
    table.set_headers({"Key", "Files", "Created", "Project"});
    table.set_align(1, output::Align::Right);
    for (const auto& entry : entries) {
        table.add_row({entry.key, output::format_count(entry.file_count), entry.created_at,
                       entry.project_path});
    }
    table.print(writer);
    writer.info(std::to_string(entries.size()) + " cached collection(s) in " +
                platform::path_to_utf8(store.directory()));
    return 0;
}

int run_cache_clear(const cli::CacheClearCommand& cmd, output::Writer& writer) {
    cache::CacheStore store(cache_config(cmd.cache_dir, writer));
    cache::ClearResult result = store.clear(cmd.project);
    if (!result.ok) {
        writer.error(result.error.format());
        return 1;
    }

    if (cmd.project) {
        writer.info("Removed " + std::to_string(result.removed) + " cache entries for '" +
                    *cmd.project + "'");
    } else {
        writer.info("Removed " + std::to_string(result.removed) + " cache entries");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Ошибка парсинга печатается как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                const std::string text = cli::render_help(cmd.command);
                // help <неизвестная подкоманда>
                if (text.rfind("error: ", 0) == 0) {
                    writer.write(output::Stream::Stderr, text);
                    return 2;
                }
                writer.write(output::Stream::Stdout, text);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::CollectCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_collect(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::AnalyzeCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_analyze(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CacheListCommand>) {
                return run_cache_list(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CacheClearCommand>) {
                return run_cache_clear(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
