// ==============================================================================
// pattern.cpp - Отбор файлов по шаблонам
// ==============================================================================
//
// Glob реализован вручную: std::regex медленный на больших деревьях, а
// fnmatch() недоступен на Windows.
//
// ==============================================================================

#include "codecollector/pattern.hpp"

#include "codecollector/platform.hpp"

#include <algorithm>

namespace codecollector::io {

namespace {

constexpr std::size_t NPOS = std::string_view::npos;

// ----------------------------------------------------------------------------
// Классы символов [...]
// ----------------------------------------------------------------------------

/// Индекс за закрывающей ']' для класса, начинающегося в pattern[start]
/// NPOS если класс не закрыт
std::size_t class_end(std::string_view pattern, std::size_t start) {
    std::size_t i = start + 1;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        ++i;
    }
    // ']' сразу после открывающей скобки - литерал
    if (i < pattern.size() && pattern[i] == ']') {
        ++i;
    }
    while (i < pattern.size() && pattern[i] != ']') {
        ++i;
    }
    return i < pattern.size() ? i + 1 : NPOS;
}

bool class_matches(std::string_view pattern, std::size_t start, std::size_t end, char c) {
    std::size_t i = start + 1;
    const std::size_t last = end - 1;  // позиция закрывающей ']'

    bool negate = false;
    if (i < last && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool found = false;
    while (i < last) {
        char lo = pattern[i];
        if (i + 2 < last && pattern[i + 1] == '-') {
            char hi = pattern[i + 2];
            if (lo <= c && c <= hi) {
                found = true;
            }
            i += 3;
        } else {
            if (c == lo) {
                found = true;
            }
            ++i;
        }
    }
    return found != negate;
}

// ----------------------------------------------------------------------------
// Разбиение пути на компоненты
// ----------------------------------------------------------------------------

std::vector<std::string> split_segments(const std::filesystem::path& relative) {
    std::vector<std::string> segments;
    for (const auto& part : relative) {
        std::string s = platform::path_to_utf8(part);
        if (s.empty() || s == "." || s == "/") {
            continue;
        }
        segments.push_back(std::move(s));
    }
    return segments;
}

bool matches_any(const std::vector<std::string>& patterns, std::string_view name) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return glob_match(p, name); });
}

}  // namespace

// ----------------------------------------------------------------------------
// glob_match
// ----------------------------------------------------------------------------

bool glob_match(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star_p = NPOS;
    std::size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            const char tc = text[t];

            if (pc == '*') {
                star_p = p++;
                star_t = t;
                continue;
            }
            if (pc == '?') {
                if (tc != '/') {
                    ++p;
                    ++t;
                    continue;
                }
            } else if (pc == '[') {
                std::size_t end = class_end(pattern, p);
                if (end == NPOS) {
                    // Незакрытый класс - буквальная '['
                    if (tc == '[') {
                        ++p;
                        ++t;
                        continue;
                    }
                } else if (tc != '/' && class_matches(pattern, p, end, tc)) {
                    p = end;
                    ++t;
                    continue;
                }
            } else if (pc == tc) {
                ++p;
                ++t;
                continue;
            }
        }

        // Откат: последняя '*' поглощает ещё один символ (но не '/')
        if (star_p != NPOS && text[star_t] != '/') {
            p = star_p + 1;
            t = ++star_t;
            continue;
        }
        return false;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// ----------------------------------------------------------------------------
// Фиксированные правила
// ----------------------------------------------------------------------------

const std::vector<std::string>& noise_directories() {
    static const std::vector<std::string> dirs = {
        "node_modules", "__pycache__", "venv",  "env",           "build",         "dist",
        "target",       "vendor",      "out",   "site-packages", "bower_components",
        "CMakeFiles",   ".git",        ".svn",  ".hg",           ".idea",         ".vscode",
    };
    return dirs;
}

bool is_noise_segment(std::string_view segment) {
    if (!segment.empty() && segment.front() == '.') {
        return true;
    }
    const auto& dirs = noise_directories();
    return std::find(dirs.begin(), dirs.end(), segment) != dirs.end();
}

const std::vector<std::string>& default_file_types() {
    static const std::vector<std::string> types = {
        // Python / JS / TS
        "*.py", "*.pyi", "*.js", "*.jsx", "*.mjs", "*.cjs", "*.ts", "*.tsx", "*.vue", "*.svelte",
        // C / C++ / Objective-C
        "*.c", "*.h", "*.cc", "*.cpp", "*.cxx", "*.hpp", "*.hh", "*.hxx", "*.m", "*.mm",
        // JVM / .NET
        "*.java", "*.kt", "*.kts", "*.scala", "*.groovy", "*.cs", "*.fs",
        // Прочие языки
        "*.go", "*.rs", "*.rb", "*.php", "*.swift", "*.dart", "*.lua", "*.pl", "*.r", "*.jl",
        "*.ex", "*.exs", "*.erl", "*.hs", "*.clj", "*.zig", "*.nim",
        // Shell / скрипты
        "*.sh", "*.bash", "*.zsh", "*.fish", "*.ps1", "*.bat",
        // Web
        "*.html", "*.htm", "*.css", "*.scss", "*.sass", "*.less",
        // Данные и конфигурация
        "*.json", "*.yaml", "*.yml", "*.toml", "*.ini", "*.cfg", "*.xml", "*.sql", "*.proto",
        "*.graphql", "*.cmake",
        // Документация
        "*.md", "*.rst", "*.txt",
        // Файлы без расширения
        "Dockerfile", "Makefile", "CMakeLists.txt",
    };
    return types;
}

std::string normalize_file_type(std::string_view raw) {
    if (raw.empty()) {
        return {};
    }
    if (raw.find_first_of("*?[") != std::string_view::npos) {
        return std::string(raw);
    }
    if (raw.front() == '.') {
        raw.remove_prefix(1);
    }
    if (raw.empty()) {
        return {};
    }
    return "*." + std::string(raw);
}

// ----------------------------------------------------------------------------
// Исключения
// ----------------------------------------------------------------------------

bool is_excluded(const std::filesystem::path& relative, const std::vector<std::string>& exclude) {
    if (exclude.empty()) {
        return false;
    }

    const auto segments = split_segments(relative);
    if (segments.empty()) {
        return false;
    }

    for (const auto& raw : exclude) {
        std::string_view pattern = raw;
        bool dir_only = false;
        while (pattern.size() > 1 && pattern.back() == '/') {
            pattern.remove_suffix(1);
            dir_only = true;
        }
        while (pattern.size() > 2 && pattern.substr(0, 2) == "./") {
            pattern.remove_prefix(2);
        }
        if (pattern.empty()) {
            continue;
        }

        if (pattern.find('/') != std::string_view::npos) {
            // Шаблон пути: сравниваем с каждым префиксом ("src/gen" исключает поддерево)
            std::string prefix;
            const std::size_t limit = dir_only ? segments.size() - 1 : segments.size();
            for (std::size_t i = 0; i < limit; ++i) {
                if (i > 0) {
                    prefix += '/';
                }
                prefix += segments[i];
                if (glob_match(pattern, prefix)) {
                    return true;
                }
            }
            continue;
        }

        // Шаблон имени: имя файла и каждый компонент директории
        const std::size_t limit = dir_only ? segments.size() - 1 : segments.size();
        for (std::size_t i = 0; i < limit; ++i) {
            if (glob_match(pattern, segments[i])) {
                return true;
            }
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// is_eligible
// ----------------------------------------------------------------------------

bool is_eligible(const std::filesystem::path& relative, const PatternSet& patterns) {
    const auto segments = split_segments(relative);
    if (segments.empty()) {
        return false;
    }

    for (const auto& segment : segments) {
        if (is_noise_segment(segment)) {
            return false;
        }
    }

    const std::string& filename = segments.back();

    // include - строгий allow-list
    if (!patterns.include.empty()) {
        return matches_any(patterns.include, filename);
    }

    const auto& types = patterns.file_types.empty() ? default_file_types() : patterns.file_types;
    if (!matches_any(types, filename)) {
        return false;
    }

    return !is_excluded(relative, patterns.exclude);
}

}  // namespace codecollector::io
